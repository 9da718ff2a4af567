#include <algorithm>

#include <boost/algorithm/string/predicate.hpp>
#include <openssl/rand.h>

#include "assertion.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include "wally.hpp"

namespace spvd {

    void get_random_bytes(std::size_t num_bytes, void* output_bytes, std::size_t siz)
    {
        // We only allow fetching up to 32 bytes of random data
        SPVD_RUNTIME_ASSERT(output_bytes);
        SPVD_RUNTIME_ASSERT(num_bytes <= 32 && num_bytes <= siz);

        std::array<unsigned char, 64> buf;
        SPVD_RUNTIME_ASSERT(RAND_bytes(buf.data(), static_cast<int>(buf.size())) == 1);

        // Only hand out half of the hashed state
        auto hashed = sha512(buf);
        std::copy(hashed.begin(), hashed.begin() + num_bytes, static_cast<unsigned char*>(output_bytes));

        wally_bzero(buf.data(), buf.size());
        wally_bzero(hashed.data(), hashed.size());
    }

    bool nsee_log_info(std::string message, const char* context)
    {
        try {
            // Remove any useless boost prefix and trailing newline
            if (boost::algorithm::starts_with(message, "Throw location unknown")) {
                message.erase(0, 62);
            }
            if (!message.empty() && message.back() == '\n') {
                message.pop_back();
            }
        } catch (const std::exception&) {
        }
        SPVD_LOG_SEV(log_level::info) << context << (*context ? " " : "") << "ignoring exception:" << message;
        return true;
    }

} // namespace spvd
