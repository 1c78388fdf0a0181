/**
 * @file worker_codec.hpp
 * @brief Binary framing of an isolated worker's single response.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace dagbuild {

struct WorkerResponse {
    bool success{false};
    TaskReport report;      ///< valid when success
    std::string trace;      ///< valid when !success
};

/**
 * @brief Encodes/decodes what a process worker sends back to its parent.
 *
 * Wire format (all multi-byte values are big-endian):
 *
 *   Success: [1B status=0][4B name_len][name bytes][1B ran][8B elapsed_us]
 *   Failure: [1B status=1][4B trace_len][trace bytes]
 */
struct WorkerCodec {
    static std::vector<uint8_t> encode_success(const TaskReport& report);
    static std::vector<uint8_t> encode_failure(const std::string& trace);

    static Result<WorkerResponse> decode(const std::vector<uint8_t>& data);

    /// Total length of the frame starting at data[0], once its header
    /// has arrived. Unknown statuses are sized like a failure frame.
    static std::optional<size_t> frame_size(const std::vector<uint8_t>& data);

    static void put_u64(std::vector<uint8_t>& buf, uint64_t val);
    static void put_u32(std::vector<uint8_t>& buf, uint32_t val);
    static uint64_t get_u64(const uint8_t* p);
    static uint32_t get_u32(const uint8_t* p);
};

}  // namespace dagbuild
