#include "hpl/nats/NatsLibrary.hpp"

#include <nats/nats.h>

#include "NatsStatus.hpp"
#include "hpl/net/Logging.hpp"

namespace HPL::Nats {

namespace {

constexpr int64_t kCloseWaitMs = 5000;

}  // namespace

std::mutex NatsLibrary::mutex_;
size_t NatsLibrary::guards_ = 0;

NatsLibrary::~NatsLibrary()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (--guards_ > 0) {
        return;
    }
    // Waits so that a following nats_Open() finds the library fully torn down
    natsStatus s = nats_CloseAndWait(kCloseWaitMs);
    if (s != NATS_OK) {
        Net::GetLogger("hpl.nats")->warn("nats library close: {}", StatusText(s));
        return;
    }
    Net::GetLogger("hpl.nats")->debug("nats library closed");
}

Net::Result<std::shared_ptr<NatsLibrary>> NatsLibrary::Acquire()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (guards_ == 0) {
            natsStatus s = nats_Open(-1);
            if (s != NATS_OK) {
                return Net::Err<std::shared_ptr<NatsLibrary>>(Net::Error(
                    Net::Error::SYSTEM_ERROR, "nats_Open", "", StatusText(s)));
            }
            Net::GetLogger("hpl.nats")->debug("nats library opened");
        }
        ++guards_;
    }
    // Built outside the lock; the destructor takes it
    std::shared_ptr<NatsLibrary> library(new NatsLibrary());
    return Net::Ok(std::move(library));
}

bool NatsLibrary::IsOpen()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return guards_ > 0;
}

size_t NatsLibrary::GetGuardCount()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return guards_;
}

}  // namespace HPL::Nats
