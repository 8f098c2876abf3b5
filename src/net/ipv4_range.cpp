/**
 * @file ipv4_range.cpp
 * @brief Ipv4Range implementation.
 *
 * @copyright Copyright (c) 2024 cozyd Contributors
 * @license MIT License
 */

#include "cozyd/net/ipv4_range.hpp"

#include <cctype>

namespace cozyd {
namespace net {

namespace {

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

bool parseDecimal(const std::string& text, uint32_t maxValue, uint32_t& value) {
    if (text.empty() || text.size() > 10) {
        return false;
    }
    uint64_t acc = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        acc = acc * 10 + static_cast<uint64_t>(c - '0');
    }
    if (acc > maxValue) {
        return false;
    }
    value = static_cast<uint32_t>(acc);
    return true;
}

void setError(std::string* error, const std::string& message) {
    if (error) {
        *error = message;
    }
}

}  // namespace

bool parseIpv4(const std::string& text, uint32_t& address) {
    uint32_t result = 0;
    size_t pos = 0;

    for (int octet = 0; octet < 4; ++octet) {
        size_t dot = text.find('.', pos);
        if (octet < 3 && dot == std::string::npos) {
            return false;
        }
        std::string part = octet < 3 ? text.substr(pos, dot - pos) : text.substr(pos);
        uint32_t value = 0;
        if (part.size() > 3 || !parseDecimal(part, 255, value)) {
            return false;
        }
        result = (result << 8) | value;
        pos = dot + 1;
    }

    address = result;
    return true;
}

std::string formatIpv4(uint32_t address) {
    return std::to_string((address >> 24) & 0xFF) + "." +
           std::to_string((address >> 16) & 0xFF) + "." +
           std::to_string((address >> 8) & 0xFF) + "." +
           std::to_string(address & 0xFF);
}

Ipv4Range Ipv4Range::fromBounds(uint32_t first, uint32_t last) {
    Ipv4Range range;
    range.first_ = first;
    range.last_ = last;
    range.empty_ = first > last;
    range.spec_ = formatIpv4(first) + "-" + formatIpv4(last);
    return range;
}

bool Ipv4Range::parse(const std::string& rawSpec, Ipv4Range& out, std::string* error) {
    const std::string spec = trim(rawSpec);
    if (spec.empty()) {
        setError(error, "empty subnet specification");
        return false;
    }

    Ipv4Range range;

    size_t slash = spec.find('/');
    size_t dash = spec.find('-');

    if (slash != std::string::npos) {
        uint32_t base = 0;
        uint32_t prefix = 0;
        if (!parseIpv4(spec.substr(0, slash), base)) {
            setError(error, "invalid network address in '" + spec + "'");
            return false;
        }
        if (!parseDecimal(spec.substr(slash + 1), 32, prefix)) {
            setError(error, "invalid prefix length in '" + spec + "'");
            return false;
        }

        uint32_t mask = prefix == 0 ? 0 : (0xFFFFFFFFu << (32 - prefix));
        uint32_t network = base & mask;
        uint32_t broadcast = network | ~mask;

        if (prefix >= 31) {
            range = fromBounds(network, broadcast);
        } else {
            range = fromBounds(network + 1, broadcast - 1);
        }
    } else if (dash != std::string::npos) {
        std::string left = trim(spec.substr(0, dash));
        std::string right = trim(spec.substr(dash + 1));

        uint32_t first = 0;
        if (!parseIpv4(left, first)) {
            setError(error, "invalid range start in '" + spec + "'");
            return false;
        }

        uint32_t last = 0;
        if (right.find('.') == std::string::npos) {
            uint32_t octet = 0;
            if (!parseDecimal(right, 255, octet)) {
                setError(error, "invalid range end in '" + spec + "'");
                return false;
            }
            last = (first & 0xFFFFFF00u) | octet;
        } else if (!parseIpv4(right, last)) {
            setError(error, "invalid range end in '" + spec + "'");
            return false;
        }

        if (first > last) {
            setError(error, "range start is after range end in '" + spec + "'");
            return false;
        }
        range = fromBounds(first, last);
    } else {
        uint32_t single = 0;
        if (!parseIpv4(spec, single)) {
            setError(error, "invalid address '" + spec + "'");
            return false;
        }
        range = fromBounds(single, single);
    }

    range.spec_ = spec;
    out = range;
    return true;
}

std::vector<std::string> Ipv4Range::hosts() const {
    std::vector<std::string> result;
    if (empty_) {
        return result;
    }

    result.reserve(static_cast<size_t>(hostCount()));
    for (uint64_t addr = first_; addr <= last_; ++addr) {
        result.push_back(formatIpv4(static_cast<uint32_t>(addr)));
    }
    return result;
}

}  // namespace net
}  // namespace cozyd
