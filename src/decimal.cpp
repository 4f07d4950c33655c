#include "stanza/decimal.hpp"

#include <charconv>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace Stanza {

    namespace {
        constexpr bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

        constexpr std::uint64_t k_MaxMagnitude = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    } // namespace

    Decimal::Decimal(std::int64_t units, std::uint8_t scale) : m_Units{ units }, m_Scale{ scale } {
        if (scale > max_scale) throw std::invalid_argument("Decimal scale must not exceed 18");
    }

    std::expected<Decimal, std::errc> Decimal::parse(std::string_view text) {
        size_t i = 0;
        const bool negative = !text.empty() && text[0] == '-';
        if (negative) i++;

        // Significant digits without the decimal point; `point` counts the
        // digits in front of it.
        std::string digits;
        const size_t int_start = i;
        while (i < text.size() && is_digit(text[i])) digits.push_back(text[i++]);
        if (i == int_start) return std::unexpected(std::errc::invalid_argument);
        if (digits.size() > 1 && digits[0] == '0') return std::unexpected(std::errc::invalid_argument);
        long long point = static_cast<long long>(digits.size());

        if (i < text.size() && text[i] == '.') {
            i++;
            const size_t frac_start = i;
            while (i < text.size() && is_digit(text[i])) digits.push_back(text[i++]);
            if (i == frac_start) return std::unexpected(std::errc::invalid_argument);
        }

        if (i < text.size() && (text[i] == 'e' || text[i] == 'E')) {
            i++;
            const bool exp_negative = i < text.size() && text[i] == '-';
            if (i < text.size() && (text[i] == '+' || text[i] == '-')) i++;
            const size_t exp_start = i;
            while (i < text.size() && is_digit(text[i])) i++;
            if (i == exp_start) return std::unexpected(std::errc::invalid_argument);

            long long exponent = 0;
            auto fc = std::from_chars(text.data() + exp_start, text.data() + i, exponent);
            if (fc.ec == std::errc::result_out_of_range) exponent = std::numeric_limits<int>::max();
            if (exponent > std::numeric_limits<int>::max()) exponent = std::numeric_limits<int>::max();
            point += exp_negative ? -exponent : exponent;
        }
        if (i != text.size()) return std::unexpected(std::errc::invalid_argument);

        const auto first = digits.find_first_not_of('0');
        if (first == std::string::npos) return Decimal{};
        digits.erase(0, first);
        point -= static_cast<long long>(first);

        if (point > 19) return std::unexpected(std::errc::result_out_of_range);
        // Smaller than half of the smallest unit
        if (point < -static_cast<long long>(max_scale)) return Decimal{};
        if (point < 0) {
            digits.insert(0, static_cast<size_t>(-point), '0');
            point = 0;
        }
        if (static_cast<long long>(digits.size()) < point) digits.append(static_cast<size_t>(point - static_cast<long long>(digits.size())), '0');

        bool round_up = false;
        const size_t keep = static_cast<size_t>(point) + max_scale;
        if (digits.size() > keep) {
            round_up = digits[keep] >= '5';
            digits.resize(keep);
        }

        std::uint64_t magnitude = 0;
        for (char c : digits) {
            const auto d = static_cast<std::uint64_t>(c - '0');
            if (magnitude > (std::numeric_limits<std::uint64_t>::max() - d) / 10) return std::unexpected(std::errc::result_out_of_range);
            magnitude = magnitude * 10 + d;
        }
        if (round_up) {
            if (magnitude == std::numeric_limits<std::uint64_t>::max()) return std::unexpected(std::errc::result_out_of_range);
            magnitude++;
        }

        const std::uint64_t limit = negative ? k_MaxMagnitude + 1 : k_MaxMagnitude;
        if (magnitude > limit) return std::unexpected(std::errc::result_out_of_range);

        std::int64_t units = 0;
        if (negative) units = magnitude == k_MaxMagnitude + 1 ? std::numeric_limits<std::int64_t>::min() : -static_cast<std::int64_t>(magnitude);
        else units = static_cast<std::int64_t>(magnitude);

        return Decimal{ units, static_cast<std::uint8_t>(digits.size() - static_cast<size_t>(point)) };
    }

    Decimal Decimal::normalized() const noexcept {
        Decimal d = *this;
        while (d.m_Scale > 0 && d.m_Units % 10 == 0) {
            d.m_Units /= 10;
            d.m_Scale--;
        }
        return d;
    }

    double Decimal::to_double() const noexcept {
        return static_cast<double>(m_Units) / std::pow(10.0, m_Scale);
    }

    std::string Decimal::to_string() const {
        const bool negative = m_Units < 0;
        std::uint64_t magnitude = negative ? (~static_cast<std::uint64_t>(m_Units) + 1) : static_cast<std::uint64_t>(m_Units);

        char buf[24];
        const auto res = std::to_chars(buf, buf + sizeof(buf), magnitude);
        std::string digits(buf, res.ptr);
        if (digits.size() <= m_Scale) digits.insert(0, m_Scale - digits.size() + 1, '0');

        std::string out;
        if (negative) out.push_back('-');
        out.append(digits, 0, digits.size() - m_Scale);
        if (m_Scale > 0) {
            out.push_back('.');
            out.append(digits, digits.size() - m_Scale, m_Scale);
        }
        return out;
    }

    bool operator==(const Decimal& lhs, const Decimal& rhs) noexcept {
        const Decimal a = lhs.normalized();
        const Decimal b = rhs.normalized();
        return a.m_Units == b.m_Units && a.m_Scale == b.m_Scale;
    }

} // namespace Stanza
