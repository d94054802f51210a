/**
 * @file uuid.hpp
 * @brief Random job identifiers
 */

#ifndef SMART_CUT_UUID_HPP
#define SMART_CUT_UUID_HPP

#include <string>

namespace smart_cut {

/**
 * @brief RFC 4122 version 4 UUID, lowercase hex with dashes
 *        ("xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx").
 * @note Thread-safe: each thread owns its generator.
 */
std::string generate_job_id();

} // namespace smart_cut

#endif // SMART_CUT_UUID_HPP
