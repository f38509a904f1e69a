/**
 * @file gauge_frame.hpp
 * @brief autooffset source file.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace aof {

/**
 * @brief Byte layout of a gauge response frame.
 *
 * Offsets are absolute within the frame (header included). Defaults match a
 * 20-word batch read starting at the machine-id register.
 */
struct GaugeFrameLayout {
    std::size_t endCodeOffset = 9;
    std::size_t machineIdOffset = 11;
    std::size_t statusOffset = 13;
    std::uint16_t completeStatusCode = 1;
    std::vector<std::size_t> slotOffsets{31, 35};
    std::size_t minimumFrameBytes = 51;
};

/**
 * @brief Decoded gauge response.
 */
struct GaugeResponse {
    std::uint16_t endCode = 0;
    std::uint16_t machineId = 0;
    std::uint16_t statusCode = 0;
    bool complete = false;
    std::vector<std::int32_t> slots;
};

/**
 * @brief Pre-encoded command byte sequences sent to the gauge.
 */
struct GaugeCommandSet {
    std::vector<std::uint8_t> read;
    std::vector<std::uint8_t> resetAssert;
    std::vector<std::uint8_t> resetClear;

    static GaugeCommandSet defaults();
};

enum class GaugeCommand : std::uint8_t {
    Read,
    ResetAssert,
    ResetClear,
};

const char* toString(GaugeCommand command);

/**
 * @brief Length-prefixed frame codec for one gauge connection.
 *
 * Bytes are appended as they arrive; `decodeNext` splits off at most one
 * complete frame per call and keeps the remainder buffered.
 */
class GaugeFrameCodec {
public:
    static constexpr std::size_t kHeaderBytes = 9;
    static constexpr std::size_t kLengthFieldOffset = 7;

    enum class DecodeStatus {
        NeedMoreData,
        Dropped,
        Decoded,
    };

    explicit GaugeFrameCodec(GaugeFrameLayout layout = {});

    void append(const std::uint8_t* data, std::size_t size);
    void append(const std::vector<std::uint8_t>& data);
    void reset();
    std::size_t bufferedBytes() const noexcept;

    /**
     * @brief Attempt to decode one frame from the buffered bytes.
     * @param outResponse decoded response when status is Decoded.
     * @param outDiagnostic reason when status is Dropped.
     */
    DecodeStatus decodeNext(GaugeResponse& outResponse, std::string& outDiagnostic);

    /**
     * @brief Parse one complete frame. Returns false with a diagnostic for
     * short frames or frames carrying a non-zero end code.
     */
    static bool parseResponse(const std::vector<std::uint8_t>& frame,
                              const GaugeFrameLayout& layout,
                              GaugeResponse& outResponse,
                              std::string& outDiagnostic);

    static void encodeCommand(const std::vector<std::uint8_t>& command,
                              std::vector<std::uint8_t>& outbound);

    /**
     * @brief Build a response frame for the given layout (simulator and tests).
     */
    static std::vector<std::uint8_t> buildResponse(const GaugeResponse& response,
                                                   const GaugeFrameLayout& layout);

    static std::int32_t decodeSlot(const std::vector<std::uint8_t>& frame, std::size_t offset);
    static void encodeSlot(std::vector<std::uint8_t>& frame, std::size_t offset, std::int32_t raw);

    static bool parseHex(const std::string& text, std::vector<std::uint8_t>& outBytes,
                         std::string& outError);
    static std::string toHex(const std::vector<std::uint8_t>& bytes);

private:
    GaugeFrameLayout layout_;
    std::vector<std::uint8_t> buffer_;
};

} // namespace aof
