// ==============================================================================
// fiq/glob.hpp - Shell-style glob для имён файлов
// ==============================================================================
//
// Синтаксис:
//   *        любая последовательность символов (в том числе пустая)
//   ?        ровно один символ
//   [abc]    класс символов, диапазоны [a-z], отрицание [!a] или [^a]
//   {a,b}    альтернатива (допускается вложенность)
//   \x       буквальный символ x
//
// Символ = кодовая точка UTF-8. Некорректный байт считается отдельным
// символом и совпадает только сам с собой (или с ? / *).
//
// Альтернативы раскрываются при компиляции в набор линейных шаблонов.
// Каждый шаблон сравнивается за O(n * m) (жадная звезда с откатом к
// последней *), экспоненциального перебора нет.
// Сравнение регистрозависимое.
//
// ==============================================================================

#ifndef FIQ_GLOB_HPP
#define FIQ_GLOB_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fiq::glob {

/// Предел числа альтернатив после раскрытия {..}
constexpr std::size_t MAX_ALTERNATIVES = 1024;

/// Скомпилированный glob-предикат
class GlobMatcher {
public:
    /// Скомпилировать паттерн. nullopt если паттерн некорректен
    /// (незакрытые [ или {, лишняя }, пустой класс, обратный диапазон,
    /// больше MAX_ALTERNATIVES альтернатив).
    static std::optional<GlobMatcher> compile(std::string_view pattern);

    /// Проверить имя файла (basename) на соответствие
    bool is_match(std::string_view name) const;

    /// Исходный паттерн
    const std::string& pattern() const { return pattern_; }

    /// Число линейных шаблонов после раскрытия {..}
    std::size_t alternative_count() const { return alternatives_.size(); }

private:
    enum class TokenKind { Literal, AnyChar, Class, Star };

    struct Token {
        TokenKind kind = TokenKind::Literal;
        char32_t ch = 0;          // Literal
        std::size_t class_id = 0;  // Class
    };

    struct CharClass {
        bool negated = false;
        std::vector<std::pair<char32_t, char32_t>> ranges;

        bool contains(char32_t c) const;
    };

    using Sequence = std::vector<Token>;

    class Parser;

    GlobMatcher() = default;

    bool token_matches(const Token& token, char32_t c) const;
    bool match_sequence(const Sequence& seq, const std::vector<char32_t>& name) const;

    std::string pattern_;
    std::vector<Sequence> alternatives_;
    std::vector<CharClass> classes_;
};

/// Разложить UTF-8 строку на кодовые точки. Некорректный байт b
/// превращается в 0x110000 + b (вне диапазона Unicode).
std::vector<char32_t> decode_code_points(std::string_view text);

}  // namespace fiq::glob

#endif  // FIQ_GLOB_HPP
