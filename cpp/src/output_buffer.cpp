#include "output_buffer.hpp"

#include <utility>

namespace agentshell {
namespace core {

namespace {

constexpr const char* REPLACEMENT_CHAR = "\xEF\xBF\xBD"; // U+FFFD

// Sequence length announced by a lead byte, 0 when it cannot start one.
size_t sequence_length(unsigned char c) noexcept {
    if (c < 0x80) return 1;
    if (c >= 0xC2 && c <= 0xDF) return 2;
    if (c >= 0xE0 && c <= 0xEF) return 3;
    if (c >= 0xF0 && c <= 0xF4) return 4;
    return 0;
}

// Second byte ranges exclude overlongs, surrogates and > U+10FFFF.
bool second_byte_ok(unsigned char lead, unsigned char c) noexcept {
    switch (lead) {
        case 0xE0: return c >= 0xA0 && c <= 0xBF;
        case 0xED: return c >= 0x80 && c <= 0x9F;
        case 0xF0: return c >= 0x90 && c <= 0xBF;
        case 0xF4: return c >= 0x80 && c <= 0x8F;
        default:   return c >= 0x80 && c <= 0xBF;
    }
}

bool is_continuation(unsigned char c) noexcept { return (c & 0xC0) == 0x80; }

} // namespace

std::string Utf8Decoder::decode(std::string_view bytes, bool final) {
    std::string joined;
    std::string_view src = bytes;
    if (!pending_.empty()) {
        joined.swap(pending_);
        joined.append(bytes);
        src = joined;
    }

    std::string out;
    out.reserve(src.size());

    size_t i = 0;
    const size_t n = src.size();
    while (i < n) {
        const auto c = static_cast<unsigned char>(src[i]);
        if (c < 0x80) {
            out.push_back(static_cast<char>(c));
            ++i;
            continue;
        }

        const size_t len = sequence_length(c);
        if (len == 0) {
            out += REPLACEMENT_CHAR;
            ++i;
            continue;
        }

        size_t k = 1;
        bool bad = false;
        while (k < len && i + k < n) {
            const auto cc = static_cast<unsigned char>(src[i + k]);
            const bool ok = (k == 1) ? second_byte_ok(c, cc) : is_continuation(cc);
            if (!ok) { bad = true; break; }
            ++k;
        }

        if (bad) {
            // maximal valid prefix collapses into one replacement
            out += REPLACEMENT_CHAR;
            i += k;
            continue;
        }
        if (k < len) {
            // input ends inside a valid prefix
            if (final) out += REPLACEMENT_CHAR;
            else pending_.assign(src.substr(i));
            break;
        }

        out.append(src.data() + i, len);
        i += len;
    }
    return out;
}

OutputBuffer::OutputBuffer(size_t capacity, std::string completionMarker)
    : capacity_(capacity == 0 ? 1 : capacity),
      marker_(std::move(completionMarker)) {}

void OutputBuffer::push_locked_(std::string chunk) {
    if (chunk.empty()) return;

    if (!marker_.empty()) {
        std::string probe = markerTail_;
        probe += chunk;
        if (phase_ == Phase::Running && probe.find(marker_) != std::string::npos) {
            phase_ = Phase::Idle;
        }
        const size_t keep = marker_.size() - 1;
        markerTail_ = probe.size() > keep ? probe.substr(probe.size() - keep) : std::move(probe);
    }

    chunks_.push_back(std::move(chunk));
    while (chunks_.size() > capacity_) {
        base_ += chunks_.front().size();
        chunks_.pop_front();
    }
}

std::string OutputBuffer::joined_locked_() const {
    size_t total = 0;
    for (const auto& c : chunks_) total += c.size();

    std::string out;
    out.reserve(total);
    for (const auto& c : chunks_) out += c;
    return out;
}

void OutputBuffer::drop_all_locked_() {
    for (const auto& c : chunks_) base_ += c.size();
    chunks_.clear();
}

void OutputBuffer::append(std::string chunk) {
    std::lock_guard<std::mutex> lk(mx_);
    push_locked_(std::move(chunk));
}

void OutputBuffer::append_bytes(std::string_view bytes) {
    std::lock_guard<std::mutex> lk(mx_);
    push_locked_(decoder_.decode(bytes));
}

void OutputBuffer::finish() {
    std::lock_guard<std::mutex> lk(mx_);
    push_locked_(decoder_.decode({}, /*final=*/true));
}

std::string OutputBuffer::drain(bool clear) {
    std::lock_guard<std::mutex> lk(mx_);
    std::string out = joined_locked_();
    if (clear) drop_all_locked_();
    return out;
}

OutputWindow OutputBuffer::window() const {
    std::lock_guard<std::mutex> lk(mx_);
    return OutputWindow{joined_locked_(), base_};
}

void OutputBuffer::clear() {
    std::lock_guard<std::mutex> lk(mx_);
    drop_all_locked_();
    markerTail_.clear();
}

void OutputBuffer::begin_command() {
    std::lock_guard<std::mutex> lk(mx_);
    phase_ = Phase::Running;
    markerTail_.clear();
}

void OutputBuffer::end_command() {
    std::lock_guard<std::mutex> lk(mx_);
    phase_ = Phase::Idle;
}

OutputBuffer::Phase OutputBuffer::phase() const {
    std::lock_guard<std::mutex> lk(mx_);
    return phase_;
}

size_t OutputBuffer::size() const {
    std::lock_guard<std::mutex> lk(mx_);
    return chunks_.size();
}

} // namespace core
} // namespace agentshell
