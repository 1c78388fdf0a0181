/**
 * @file worker_codec.cpp
 * @brief WorkerCodec binary serialization.
 */

#include "executor/worker_codec.hpp"

namespace dagbuild {

namespace {
constexpr uint8_t kStatusSuccess = 0;
constexpr uint8_t kStatusFailure = 1;
}

// ─────────────────────────────────────────────
// Helper: big-endian encode/decode
// ─────────────────────────────────────────────

void WorkerCodec::put_u64(std::vector<uint8_t>& buf, uint64_t val) {
    for (int i = 7; i >= 0; --i) {
        buf.push_back(static_cast<uint8_t>((val >> (i * 8)) & 0xFF));
    }
}

void WorkerCodec::put_u32(std::vector<uint8_t>& buf, uint32_t val) {
    buf.push_back(static_cast<uint8_t>((val >> 24) & 0xFF));
    buf.push_back(static_cast<uint8_t>((val >> 16) & 0xFF));
    buf.push_back(static_cast<uint8_t>((val >> 8) & 0xFF));
    buf.push_back(static_cast<uint8_t>(val & 0xFF));
}

uint64_t WorkerCodec::get_u64(const uint8_t* p) {
    uint64_t val = 0;
    for (int i = 0; i < 8; ++i) {
        val = (val << 8) | p[i];
    }
    return val;
}

uint32_t WorkerCodec::get_u32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24)
         | (static_cast<uint32_t>(p[1]) << 16)
         | (static_cast<uint32_t>(p[2]) << 8)
         | static_cast<uint32_t>(p[3]);
}

// ─────────────────────────────────────────────
// Encode
// ─────────────────────────────────────────────

std::vector<uint8_t> WorkerCodec::encode_success(const TaskReport& report) {
    std::vector<uint8_t> buf;
    buf.reserve(1 + 4 + report.name.size() + 1 + 8);

    buf.push_back(kStatusSuccess);
    put_u32(buf, static_cast<uint32_t>(report.name.size()));
    buf.insert(buf.end(), report.name.begin(), report.name.end());
    buf.push_back(report.ran ? 1 : 0);
    put_u64(buf, static_cast<uint64_t>(report.elapsed.count()));

    return buf;
}

std::vector<uint8_t> WorkerCodec::encode_failure(const std::string& trace) {
    std::vector<uint8_t> buf;
    buf.reserve(1 + 4 + trace.size());

    buf.push_back(kStatusFailure);
    put_u32(buf, static_cast<uint32_t>(trace.size()));
    buf.insert(buf.end(), trace.begin(), trace.end());

    return buf;
}

// ─────────────────────────────────────────────
// Decode
// ─────────────────────────────────────────────

std::optional<size_t> WorkerCodec::frame_size(const std::vector<uint8_t>& data) {
    if (data.size() < 5) return std::nullopt;
    const size_t len = get_u32(data.data() + 1);
    if (data[0] == kStatusSuccess) return 5 + len + 1 + 8;
    return 5 + len;
}

Result<WorkerResponse> WorkerCodec::decode(const std::vector<uint8_t>& data) {
    if (data.size() < 5) {
        return Error{"Worker response too short (" + std::to_string(data.size()) + " bytes)"};
    }

    const uint8_t* p = data.data();
    const uint8_t status = p[0];
    const uint32_t len = get_u32(p + 1);
    size_t offset = 5;

    if (data.size() - offset < len) {
        return Error{"Worker response truncated"};
    }
    std::string text(reinterpret_cast<const char*>(p + offset), len);
    offset += len;

    WorkerResponse response;

    if (status == kStatusFailure) {
        if (offset != data.size()) return Error{"Trailing bytes after worker failure"};
        response.success = false;
        response.trace = std::move(text);
        return response;
    }

    if (status != kStatusSuccess) {
        return Error{"Unknown worker response status " + std::to_string(status)};
    }
    if (data.size() - offset != 1 + 8) {
        return Error{"Malformed worker success response"};
    }

    response.success = true;
    response.report.name = std::move(text);
    response.report.ran = p[offset] != 0;
    response.report.elapsed = Duration{static_cast<int64_t>(get_u64(p + offset + 1))};
    return response;
}

}  // namespace dagbuild
