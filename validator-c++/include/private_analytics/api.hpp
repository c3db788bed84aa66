#ifndef PRIVATE_ANALYTICS_API_HPP
#define PRIVATE_ANALYTICS_API_HPP

#include <cstddef>

extern "C" {
    // PhiCategory code of the first prohibited pattern in the buffer, 0 when clean
    int detect_phi(const char* buffer, size_t length);

    // GuaranteeFailure code for a serialized AnonymizedEvent, 0 when it may be released,
    // -1 when the buffer does not parse
    int validate_anonymized_event(const char* buffer, size_t length,
                                  unsigned int k, size_t max_payload_bytes);
}


#endif //PRIVATE_ANALYTICS_API_HPP
