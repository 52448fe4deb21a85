#include "unflake/core/pass_compactor.hpp"
#include "unflake/core/line_classifier.hpp"
#include "unflake/core/python_tokenizer.hpp"
#include "unflake/core/source_text.hpp"
#include "unflake/core/text_utils.hpp"
#include <optional>

namespace unflake {

auto useless_pass_line_numbers(std::string_view source) -> std::set<size_t> {
    std::set<size_t> marked;

    std::optional<TokenType> previous_type;
    std::optional<size_t> last_pass_row;
    std::string last_pass_indentation;
    std::string previous_line;
    bool seen_statement = false;
    size_t depth = 0;
    std::optional<size_t> module_first_pass_row;

    for (const auto& token : tokenize(source)) {
        bool is_pass = token.type == TokenType::NAME && strip(token.line) == "pass";

        // Leading pass
        if (last_pass_row && token.row == *last_pass_row + 1
            && indentation(token.line) == last_pass_indentation && is_atom(token.type)
            && !is_pass) {
            marked.insert(*last_pass_row);
        }

        // A pass opening the module goes once another module-level
        // statement turns up
        if (module_first_pass_row && depth == 0 && token.row > *module_first_pass_row
            && (is_atom(token.type) || token.type == TokenType::OP) && !is_pass) {
            marked.insert(*module_first_pass_row);
            module_first_pass_row.reset();
        }

        if (is_pass) {
            last_pass_row = token.row;
            last_pass_indentation = indentation(token.line);
            if (!seen_statement && depth == 0) {
                module_first_pass_row = token.row;
            }
        }

        // Trailing pass
        if (is_pass && seen_statement && previous_type != TokenType::INDENT
            && !rstrip(previous_line).ends_with('\\')) {
            marked.insert(token.row);
        }

        if (token.type == TokenType::INDENT) {
            ++depth;
        } else if (token.type == TokenType::DEDENT && depth > 0) {
            --depth;
        }
        if (token.type != TokenType::COMMENT && token.type != TokenType::NL) {
            seen_statement = true;
        }

        previous_type = token.type;
        previous_line = token.line;
    }

    return marked;
}

auto compact(const std::string& source) -> std::string {
    std::set<size_t> marked;
    try {
        marked = useless_pass_line_numbers(source);
    } catch (const TokenizeError&) {
        return source;
    }

    if (marked.empty()) {
        return source;
    }

    auto text = split_source(source);
    SourceText kept;
    kept.lines.reserve(text.lines.size());
    for (size_t i = 0; i < text.lines.size(); ++i) {
        if (!marked.contains(i + 1)) {
            kept.lines.push_back(std::move(text.lines[i]));
        }
    }
    return render_source(kept);
}

} // namespace unflake
