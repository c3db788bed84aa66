#ifndef PRIVATE_ANALYTICS_PIPELINE_TRANSPORT_HPP
#define PRIVATE_ANALYTICS_PIPELINE_TRANSPORT_HPP

#include <memory>

#include <analytics.pb.h>

namespace private_analytics {

// Outbound delivery to the analytics backend. Only events that passed the
// guarantee checker reach it; each one is handed over exactly once.
class Transport {
public:
    virtual ~Transport() = default;
    virtual void deliver(std::unique_ptr<const proto::AnonymizedEvent> event) = 0;
};

} // namespace private_analytics

#endif //PRIVATE_ANALYTICS_PIPELINE_TRANSPORT_HPP
