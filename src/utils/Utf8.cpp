#include "utils/Utf8.hpp"

namespace echoexec::utils {

namespace {

const char kReplacement[] = "\xEF\xBF\xBD";

bool isContinuation(unsigned char c) {
    return c >= 0x80 && c <= 0xBF;
}

} // namespace

std::string toUtf8Lossy(const std::string& bytes) {
    std::string out;
    out.reserve(bytes.size());

    std::size_t i = 0;
    const std::size_t n = bytes.size();
    while (i < n) {
        unsigned char lead = static_cast<unsigned char>(bytes[i]);
        if (lead < 0x80) {
            out.push_back(static_cast<char>(lead));
            ++i;
            continue;
        }

        std::size_t length = 0;
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;
        if (lead >= 0xC2 && lead <= 0xDF) {
            length = 2;
        } else if (lead == 0xE0) {
            length = 3;
            lo = 0xA0;
        } else if ((lead >= 0xE1 && lead <= 0xEC) || lead == 0xEE || lead == 0xEF) {
            length = 3;
        } else if (lead == 0xED) {
            length = 3;
            hi = 0x9F;
        } else if (lead == 0xF0) {
            length = 4;
            lo = 0x90;
        } else if (lead >= 0xF1 && lead <= 0xF3) {
            length = 4;
        } else if (lead == 0xF4) {
            length = 4;
            hi = 0x8F;
        } else {
            out += kReplacement;
            ++i;
            continue;
        }

        // Второй байт имеет суженный диапазон, остальные - обычные continuation
        std::size_t j = i + 1;
        if (j >= n || static_cast<unsigned char>(bytes[j]) < lo || static_cast<unsigned char>(bytes[j]) > hi) {
            out += kReplacement;
            i = j;
            continue;
        }
        ++j;
        while (j < i + length && j < n && isContinuation(static_cast<unsigned char>(bytes[j]))) {
            ++j;
        }

        if (j == i + length) {
            out.append(bytes, i, length);
        } else {
            out += kReplacement;
        }
        i = j;
    }

    return out;
}

} // namespace echoexec::utils
