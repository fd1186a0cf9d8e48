/**
 * MixGraph - Content Hashing
 */

#ifndef MIXGRAPH_CONTENT_HASH_H
#define MIXGRAPH_CONTENT_HASH_H

#include "mixgraph/types.h"
#include <string>

namespace mixgraph {

/**
 * Hex SHA-256 of a file's bytes.
 */
Result<std::string> hash_file(const std::string& path);

/**
 * Hex SHA-256 of a string.
 */
std::string hash_string(const std::string& data);

} // namespace mixgraph

#endif // MIXGRAPH_CONTENT_HASH_H
