// ==============================================================================
// glob.cpp - Shell-style glob для имён файлов
// ==============================================================================

#include "fiq/glob.hpp"

namespace fiq::glob {

namespace {

constexpr char32_t INVALID_BYTE_BASE = 0x110000;

}  // namespace

std::vector<char32_t> decode_code_points(std::string_view text) {
    std::vector<char32_t> out;
    out.reserve(text.size());

    std::size_t i = 0;
    while (i < text.size()) {
        auto b0 = static_cast<unsigned char>(text[i]);
        std::size_t len = 0;
        char32_t cp = 0;
        if (b0 < 0x80) {
            len = 1;
            cp = b0;
        } else if ((b0 & 0xE0) == 0xC0 && b0 >= 0xC2) {
            len = 2;
            cp = b0 & 0x1F;
        } else if ((b0 & 0xF0) == 0xE0) {
            len = 3;
            cp = b0 & 0x0F;
        } else if ((b0 & 0xF8) == 0xF0 && b0 <= 0xF4) {
            len = 4;
            cp = b0 & 0x07;
        }

        bool ok = len > 0 && i + len <= text.size();
        for (std::size_t k = 1; ok && k < len; ++k) {
            auto b = static_cast<unsigned char>(text[i + k]);
            if ((b & 0xC0) != 0x80) {
                ok = false;
            } else {
                cp = (cp << 6) | (b & 0x3F);
            }
        }

        if (ok) {
            out.push_back(cp);
            i += len;
        } else {
            out.push_back(INVALID_BYTE_BASE + b0);
            ++i;
        }
    }
    return out;
}

// ----------------------------------------------------------------------------
// Разбор паттерна
// ----------------------------------------------------------------------------

class GlobMatcher::Parser {
public:
    Parser(std::vector<char32_t> pattern, std::vector<CharClass>& classes)
        : p_(std::move(pattern)), classes_(classes) {}

    /// Весь паттерн -> набор линейных шаблонов
    std::optional<std::vector<Sequence>> parse() {
        auto seqs = parse_sequence(0);
        if (!seqs || pos_ != p_.size()) {
            return std::nullopt;
        }
        return seqs;
    }

private:
    /// Последовательность до ',' или '}' текущего уровня
    std::optional<std::vector<Sequence>> parse_sequence(int depth) {
        std::vector<Sequence> current(1);

        while (pos_ < p_.size()) {
            char32_t c = p_[pos_];
            if (c == '}') {
                if (depth == 0) {
                    return std::nullopt;
                }
                return current;
            }
            if (c == ',' && depth > 0) {
                return current;
            }

            if (c == '{') {
                ++pos_;
                auto alts = parse_alternation(depth + 1);
                if (!alts) {
                    return std::nullopt;
                }
                if (current.size() * alts->size() > MAX_ALTERNATIVES) {
                    return std::nullopt;
                }
                std::vector<Sequence> joined;
                joined.reserve(current.size() * alts->size());
                for (const auto& head : current) {
                    for (const auto& tail : *alts) {
                        Sequence s = head;
                        s.insert(s.end(), tail.begin(), tail.end());
                        joined.push_back(std::move(s));
                    }
                }
                current = std::move(joined);
                continue;
            }

            Token token;
            if (c == '*') {
                token.kind = TokenKind::Star;
                ++pos_;
            } else if (c == '?') {
                token.kind = TokenKind::AnyChar;
                ++pos_;
            } else if (c == '[') {
                auto id = parse_class();
                if (!id) {
                    return std::nullopt;
                }
                token.kind = TokenKind::Class;
                token.class_id = *id;
            } else if (c == '\\') {
                ++pos_;
                if (pos_ < p_.size()) {
                    token.ch = p_[pos_++];
                } else {
                    token.ch = '\\';
                }
            } else {
                token.ch = c;
                ++pos_;
            }

            for (auto& seq : current) {
                if (token.kind == TokenKind::Star && !seq.empty() &&
                    seq.back().kind == TokenKind::Star) {
                    continue;
                }
                seq.push_back(token);
            }
        }

        if (depth > 0) {
            return std::nullopt;  // нет закрывающей '}'
        }
        return current;
    }

    /// Содержимое {..}, pos_ указывает за '{'
    std::optional<std::vector<Sequence>> parse_alternation(int depth) {
        std::vector<Sequence> alts;
        for (;;) {
            auto seqs = parse_sequence(depth);
            if (!seqs || pos_ >= p_.size()) {
                return std::nullopt;
            }
            alts.insert(alts.end(), seqs->begin(), seqs->end());
            if (alts.size() > MAX_ALTERNATIVES) {
                return std::nullopt;
            }
            char32_t c = p_[pos_++];
            if (c == '}') {
                return alts;
            }
        }
    }

    /// Класс [..], pos_ указывает на '['. Возвращает индекс класса.
    std::optional<std::size_t> parse_class() {
        std::size_t i = pos_ + 1;
        CharClass cls;

        if (i < p_.size() && (p_[i] == '!' || p_[i] == '^')) {
            cls.negated = true;
            ++i;
        }

        // ']' сразу после открытия - буквальный символ
        bool first = true;
        while (i < p_.size()) {
            if (p_[i] == ']' && !first) {
                break;
            }
            first = false;

            char32_t lo = p_[i];
            if (lo == '\\' && i + 1 < p_.size()) {
                lo = p_[++i];
            }
            ++i;

            char32_t hi = lo;
            if (i + 1 < p_.size() && p_[i] == '-' && p_[i + 1] != ']') {
                i += 1;
                hi = p_[i];
                if (hi == '\\' && i + 1 < p_.size()) {
                    hi = p_[++i];
                }
                ++i;
                if (hi < lo) {
                    return std::nullopt;
                }
            }
            cls.ranges.emplace_back(lo, hi);
        }

        if (i >= p_.size() || cls.ranges.empty()) {
            return std::nullopt;
        }

        pos_ = i + 1;
        classes_.push_back(std::move(cls));
        return classes_.size() - 1;
    }

    std::vector<char32_t> p_;
    std::size_t pos_ = 0;
    std::vector<CharClass>& classes_;
};

// ----------------------------------------------------------------------------
// GlobMatcher
// ----------------------------------------------------------------------------

bool GlobMatcher::CharClass::contains(char32_t c) const {
    bool hit = false;
    for (const auto& [lo, hi] : ranges) {
        if (c >= lo && c <= hi) {
            hit = true;
            break;
        }
    }
    return hit != negated;
}

std::optional<GlobMatcher> GlobMatcher::compile(std::string_view pattern) {
    GlobMatcher matcher;
    Parser parser(decode_code_points(pattern), matcher.classes_);
    auto seqs = parser.parse();
    if (!seqs) {
        return std::nullopt;
    }
    matcher.pattern_ = std::string(pattern);
    matcher.alternatives_ = std::move(*seqs);
    return matcher;
}

bool GlobMatcher::token_matches(const Token& token, char32_t c) const {
    switch (token.kind) {
    case TokenKind::Literal:
        return token.ch == c;
    case TokenKind::AnyChar:
        return true;
    case TokenKind::Class:
        return classes_[token.class_id].contains(c);
    case TokenKind::Star:
        break;
    }
    return false;
}

bool GlobMatcher::match_sequence(const Sequence& seq, const std::vector<char32_t>& name) const {
    constexpr std::size_t NONE = static_cast<std::size_t>(-1);

    std::size_t p = 0;
    std::size_t n = 0;
    std::size_t star_p = NONE;
    std::size_t star_n = 0;

    while (n < name.size()) {
        if (p < seq.size() && seq[p].kind == TokenKind::Star) {
            star_p = p++;
            star_n = n;
        } else if (p < seq.size() && token_matches(seq[p], name[n])) {
            ++p;
            ++n;
        } else if (star_p != NONE) {
            // Последняя * поглощает ещё один символ
            p = star_p + 1;
            n = ++star_n;
        } else {
            return false;
        }
    }

    while (p < seq.size() && seq[p].kind == TokenKind::Star) {
        ++p;
    }
    return p == seq.size();
}

bool GlobMatcher::is_match(std::string_view name) const {
    auto chars = decode_code_points(name);
    for (const auto& seq : alternatives_) {
        if (match_sequence(seq, chars)) {
            return true;
        }
    }
    return false;
}

}  // namespace fiq::glob
