#include "stanza/date_time.hpp"

#include <spdlog/fmt/fmt.h>

namespace Stanza {

    namespace {
        class Cursor {
        public:
            explicit Cursor(std::string_view t) : m_Text{ t } {}

            [[nodiscard]] bool done() const noexcept { return m_Idx >= m_Text.size(); }
            [[nodiscard]] char peek() const noexcept { return done() ? '\0' : m_Text[m_Idx]; }

            bool consume(char c) noexcept {
                if (done() || m_Text[m_Idx] != c) return false;
                m_Idx++;
                return true;
            }

            // Exactly `n` digits.
            std::optional<int> fixed(size_t n) noexcept {
                if (m_Idx + n > m_Text.size()) return std::nullopt;
                int v = 0;
                for (size_t k = 0; k < n; k++) {
                    const char c = m_Text[m_Idx + k];
                    if (c < '0' || c > '9') return std::nullopt;
                    v = v * 10 + (c - '0');
                }
                m_Idx += n;
                return v;
            }

            // One or more digits scaled to nanoseconds; digits past the ninth are dropped.
            std::optional<std::int64_t> fraction() noexcept {
                std::int64_t nanos = 0;
                size_t count = 0;
                while (!done() && peek() >= '0' && peek() <= '9') {
                    if (count < 9) nanos = nanos * 10 + (peek() - '0');
                    count++;
                    m_Idx++;
                }
                if (count == 0) return std::nullopt;
                for (size_t k = count; k < 9; k++) nanos *= 10;
                return nanos;
            }

        private:
            std::string_view m_Text;
            size_t m_Idx = 0;
        };
    } // namespace

    std::optional<DateTime> DateTime::parse_iso8601(std::string_view text) {
        using namespace std::chrono;

        Cursor cur{ text };
        DateTime out;

        auto y = cur.fixed(4);
        if (!y || !cur.consume('-')) return std::nullopt;
        auto mo = cur.fixed(2);
        if (!mo || !cur.consume('-')) return std::nullopt;
        auto d = cur.fixed(2);
        if (!d) return std::nullopt;

        out.date = year{ *y } / month{ static_cast<unsigned>(*mo) } / day{ static_cast<unsigned>(*d) };
        if (!out.date.ok()) return std::nullopt;
        if (cur.done()) return out;

        if (!cur.consume('T')) return std::nullopt;
        auto h = cur.fixed(2);
        if (!h || *h > 23 || !cur.consume(':')) return std::nullopt;
        auto mi = cur.fixed(2);
        if (!mi || *mi > 59) return std::nullopt;

        int sec = 0;
        std::int64_t nanos = 0;
        if (cur.consume(':')) {
            auto s = cur.fixed(2);
            if (!s || *s > 59) return std::nullopt;
            sec = *s;
            if (cur.consume('.')) {
                auto f = cur.fraction();
                if (!f) return std::nullopt;
                nanos = *f;
            }
        }
        out.time_of_day = hours{ *h } + minutes{ *mi } + seconds{ sec } + nanoseconds{ nanos };

        if (cur.consume('Z')) {
            out.kind = zone::utc;
        } else if (cur.peek() == '+' || cur.peek() == '-') {
            const int sign = cur.peek() == '-' ? -1 : 1;
            cur.consume(cur.peek());
            auto oh = cur.fixed(2);
            if (!oh || *oh > 23 || !cur.consume(':')) return std::nullopt;
            auto om = cur.fixed(2);
            if (!om || *om > 59) return std::nullopt;
            out.kind = zone::offset;
            out.offset_minutes = static_cast<std::int16_t>(sign * (*oh * 60 + *om));
        }

        if (!cur.done()) return std::nullopt;
        return out;
    }

    std::chrono::sys_time<std::chrono::nanoseconds> DateTime::to_utc() const noexcept {
        using namespace std::chrono;
        return sys_days{ date } + time_of_day - minutes{ offset_minutes };
    }

    std::string DateTime::to_string() const {
        using namespace std::chrono;

        const auto h = duration_cast<hours>(time_of_day);
        const auto m = duration_cast<minutes>(time_of_day - h);
        const auto s = duration_cast<seconds>(time_of_day - h - m);
        const auto ns = (time_of_day - h - m - s).count();

        std::string out = fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}",
                                      static_cast<int>(date.year()), static_cast<unsigned>(date.month()),
                                      static_cast<unsigned>(date.day()), h.count(), m.count(), s.count());
        if (ns != 0) {
            std::string frac = fmt::format("{:09}", ns);
            frac.erase(frac.find_last_not_of('0') + 1);
            out += '.';
            out += frac;
        }

        switch (kind) {
        case zone::unspecified: break;
        case zone::utc: out += 'Z'; break;
        case zone::offset: {
            const int total = offset_minutes < 0 ? -offset_minutes : offset_minutes;
            out += fmt::format("{}{:02}:{:02}", offset_minutes < 0 ? '-' : '+', total / 60, total % 60);
            break;
        }
        }
        return out;
    }

} // namespace Stanza
