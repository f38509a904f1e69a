#include "autooffset/transport/gauge_frame.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace aof {
namespace {

// Batch read of 20 words from D6000 (machine id, status, ..., measurement slots).
constexpr const char* kDefaultReadHex = "500000FFFF03000C00200001040000701700A81400";
// Single-word writes of the acknowledge register D6100.
constexpr const char* kDefaultResetAssertHex = "500000FFFF03000E00200001140000D41700A801000100";
constexpr const char* kDefaultResetClearHex = "500000FFFF03000E00200001140000D41700A801000000";

constexpr std::uint8_t kResponseSubheader[] = {0xD0, 0x00, 0x00, 0xFF, 0xFF, 0x03, 0x00};

void put16le(std::vector<std::uint8_t>& out, std::size_t offset, std::uint16_t value) {
    out[offset] = static_cast<std::uint8_t>(value & 0xFFU);
    out[offset + 1] = static_cast<std::uint8_t>((value >> 8U) & 0xFFU);
}

std::uint16_t get16le(const std::vector<std::uint8_t>& in, std::size_t offset) {
    return static_cast<std::uint16_t>((static_cast<std::uint16_t>(in[offset + 1]) << 8U) |
                                      static_cast<std::uint16_t>(in[offset]));
}

std::vector<std::uint8_t> hexOrEmpty(const char* text) {
    std::vector<std::uint8_t> bytes;
    std::string error;
    if (!GaugeFrameCodec::parseHex(text, bytes, error)) {
        bytes.clear();
    }
    return bytes;
}

int hexNibble(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    const auto lower = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (lower >= 'a' && lower <= 'f') {
        return 10 + (lower - 'a');
    }
    return -1;
}

} // namespace

GaugeCommandSet GaugeCommandSet::defaults() {
    GaugeCommandSet commands;
    commands.read = hexOrEmpty(kDefaultReadHex);
    commands.resetAssert = hexOrEmpty(kDefaultResetAssertHex);
    commands.resetClear = hexOrEmpty(kDefaultResetClearHex);
    return commands;
}

const char* toString(GaugeCommand command) {
    switch (command) {
    case GaugeCommand::Read:
        return "Read";
    case GaugeCommand::ResetAssert:
        return "ResetAssert";
    case GaugeCommand::ResetClear:
        return "ResetClear";
    }
    return "Unknown";
}

GaugeFrameCodec::GaugeFrameCodec(GaugeFrameLayout layout) : layout_(std::move(layout)) {}

void GaugeFrameCodec::append(const std::uint8_t* data, std::size_t size) {
    buffer_.insert(buffer_.end(), data, data + size);
}

void GaugeFrameCodec::append(const std::vector<std::uint8_t>& data) {
    buffer_.insert(buffer_.end(), data.begin(), data.end());
}

void GaugeFrameCodec::reset() { buffer_.clear(); }

std::size_t GaugeFrameCodec::bufferedBytes() const noexcept { return buffer_.size(); }

GaugeFrameCodec::DecodeStatus GaugeFrameCodec::decodeNext(GaugeResponse& outResponse,
                                                         std::string& outDiagnostic) {
    outDiagnostic.clear();
    if (buffer_.size() < kHeaderBytes) {
        return DecodeStatus::NeedMoreData;
    }

    const auto payloadLength = static_cast<std::size_t>(get16le(buffer_, kLengthFieldOffset));
    const auto frameBytes = payloadLength + kHeaderBytes;
    if (buffer_.size() < frameBytes) {
        return DecodeStatus::NeedMoreData;
    }

    std::vector<std::uint8_t> frame(buffer_.begin(),
                                    buffer_.begin() + static_cast<std::ptrdiff_t>(frameBytes));
    buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(frameBytes));

    if (!parseResponse(frame, layout_, outResponse, outDiagnostic)) {
        return DecodeStatus::Dropped;
    }
    return DecodeStatus::Decoded;
}

bool GaugeFrameCodec::parseResponse(const std::vector<std::uint8_t>& frame,
                                    const GaugeFrameLayout& layout,
                                    GaugeResponse& outResponse,
                                    std::string& outDiagnostic) {
    if (frame.size() >= layout.endCodeOffset + 2) {
        const auto endCode = get16le(frame, layout.endCodeOffset);
        if (endCode != 0U) {
            std::ostringstream os;
            os << "gauge end code 0x" << std::hex << std::setw(4) << std::setfill('0') << endCode;
            outDiagnostic = os.str();
            return false;
        }
    }

    if (frame.size() < layout.minimumFrameBytes) {
        outDiagnostic = "short frame (" + std::to_string(frame.size()) + " < " +
                        std::to_string(layout.minimumFrameBytes) + " bytes)";
        return false;
    }

    const auto fieldFits = [&](std::size_t offset, std::size_t width) {
        return offset + width <= frame.size();
    };
    if (!fieldFits(layout.machineIdOffset, 2) || !fieldFits(layout.statusOffset, 2)) {
        outDiagnostic = "frame too short for identifier/status fields";
        return false;
    }
    for (const auto offset : layout.slotOffsets) {
        if (!fieldFits(offset, 4)) {
            outDiagnostic = "frame too short for measurement slot at offset " + std::to_string(offset);
            return false;
        }
    }

    GaugeResponse response;
    response.endCode = 0;
    response.machineId = get16le(frame, layout.machineIdOffset);
    response.statusCode = get16le(frame, layout.statusOffset);
    response.complete = response.statusCode == layout.completeStatusCode;
    response.slots.reserve(layout.slotOffsets.size());
    for (const auto offset : layout.slotOffsets) {
        response.slots.push_back(decodeSlot(frame, offset));
    }
    outResponse = std::move(response);
    return true;
}

void GaugeFrameCodec::encodeCommand(const std::vector<std::uint8_t>& command,
                                    std::vector<std::uint8_t>& outbound) {
    outbound.insert(outbound.end(), command.begin(), command.end());
}

std::vector<std::uint8_t> GaugeFrameCodec::buildResponse(const GaugeResponse& response,
                                                         const GaugeFrameLayout& layout) {
    std::size_t frameBytes = std::max<std::size_t>(layout.minimumFrameBytes, kHeaderBytes + 2);
    frameBytes = std::max(frameBytes, layout.machineIdOffset + 2);
    frameBytes = std::max(frameBytes, layout.statusOffset + 2);
    for (const auto offset : layout.slotOffsets) {
        frameBytes = std::max(frameBytes, offset + 4);
    }

    std::vector<std::uint8_t> frame(frameBytes, 0U);
    std::copy(std::begin(kResponseSubheader), std::end(kResponseSubheader), frame.begin());
    put16le(frame, kLengthFieldOffset, static_cast<std::uint16_t>(frameBytes - kHeaderBytes));
    put16le(frame, layout.endCodeOffset, response.endCode);
    put16le(frame, layout.machineIdOffset, response.machineId);
    put16le(frame, layout.statusOffset, response.statusCode);
    for (std::size_t i = 0; i < layout.slotOffsets.size() && i < response.slots.size(); ++i) {
        encodeSlot(frame, layout.slotOffsets[i], response.slots[i]);
    }
    return frame;
}

std::int32_t GaugeFrameCodec::decodeSlot(const std::vector<std::uint8_t>& frame, std::size_t offset) {
    const auto integer = static_cast<std::int16_t>(get16le(frame, offset));
    const auto fractional = static_cast<std::int16_t>(get16le(frame, offset + 2));
    return static_cast<std::int32_t>(integer) * 10000 + static_cast<std::int32_t>(fractional);
}

void GaugeFrameCodec::encodeSlot(std::vector<std::uint8_t>& frame, std::size_t offset, std::int32_t raw) {
    const auto integer = static_cast<std::int16_t>(raw / 10000);
    const auto fractional = static_cast<std::int16_t>(raw % 10000);
    put16le(frame, offset, static_cast<std::uint16_t>(integer));
    put16le(frame, offset + 2, static_cast<std::uint16_t>(fractional));
}

bool GaugeFrameCodec::parseHex(const std::string& text, std::vector<std::uint8_t>& outBytes,
                               std::string& outError) {
    std::string digits;
    digits.reserve(text.size());
    for (const char c : text) {
        if (std::isspace(static_cast<unsigned char>(c)) != 0) {
            continue;
        }
        if (hexNibble(c) < 0) {
            outError = std::string("invalid hex character '") + c + "'";
            return false;
        }
        digits.push_back(c);
    }
    if (digits.empty()) {
        outError = "hex command is empty";
        return false;
    }
    if ((digits.size() % 2U) != 0U) {
        outError = "hex command has odd number of digits";
        return false;
    }

    outBytes.clear();
    outBytes.reserve(digits.size() / 2U);
    for (std::size_t i = 0; i < digits.size(); i += 2) {
        outBytes.push_back(static_cast<std::uint8_t>((hexNibble(digits[i]) << 4) | hexNibble(digits[i + 1])));
    }
    return true;
}

std::string GaugeFrameCodec::toHex(const std::vector<std::uint8_t>& bytes) {
    std::ostringstream os;
    os << std::uppercase << std::hex << std::setfill('0');
    for (const auto byte : bytes) {
        os << std::setw(2) << static_cast<unsigned>(byte);
    }
    return os.str();
}

} // namespace aof
