/**
 * @file client.hpp
 * @brief Shared resource client handle owned by a DAG.
 */

#pragma once

namespace dagbuild {

/**
 * @brief A resource (database connection, file store, ...) shared by the
 *        tasks of a DAG. The executor only ever closes it.
 */
class IClient {
public:
    virtual ~IClient() = default;

    virtual void close() = 0;
};

}  // namespace dagbuild
