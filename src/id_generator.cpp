#include "sagabus/id_generator.hpp"

#include <array>
#include <chrono>

namespace sagabus {

CombIdGenerator::CombIdGenerator()
    : engine_(std::random_device{}()) {}

std::string CombIdGenerator::next() {
    std::array<unsigned char, 16> bytes{};

    {
        std::lock_guard<std::mutex> lock(mutex_);

        uint64_t random_high = engine_();
        uint64_t random_low = engine_();
        for (int i = 0; i < 8; ++i) {
            bytes[i] = static_cast<unsigned char>(random_high >> (i * 8));
        }
        bytes[8] = static_cast<unsigned char>(random_low);
        bytes[9] = static_cast<unsigned char>(random_low >> 8);

        auto millis = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
        // Never let the tail run backwards when the wall clock does.
        if (millis < last_millis_) {
            millis = last_millis_;
        }
        last_millis_ = millis;

        for (int i = 0; i < 6; ++i) {
            bytes[10 + i] = static_cast<unsigned char>(millis >> ((5 - i) * 8));
        }
    }

    // Version (4) and variant (10xx)
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0f) | 0x40);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3f) | 0x80);

    static const char hex_chars[] = "0123456789abcdef";
    std::string uuid;
    uuid.reserve(36);
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            uuid.push_back('-');
        }
        uuid.push_back(hex_chars[bytes[i] >> 4]);
        uuid.push_back(hex_chars[bytes[i] & 0x0f]);
    }
    return uuid;
}

} // namespace sagabus
