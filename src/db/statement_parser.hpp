#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace novelforge::db {

// Splits a migration script into independently executable statements.
//
// `--` comments are dropped up to the end of the line (the newline is kept).
// Outside a trigger body `;` ends a statement. Once the current statement has
// read `CREATE [TEMP|TEMPORARY] TRIGGER`, the word `BEGIN` opens the trigger
// body, and only `END` followed by `;` closes it again, so the whole trigger
// comes out as one statement ending in `END;`. Quoted text ('...', "..." and
// `...`) is copied verbatim and never terminates or comments anything.
//
// The parser never fails; statement validity is left to the engine.
class StatementParser {
public:
    enum class State {
        Normal,
        InTriggerBody,
        InLineComment,
    };

    static std::vector<std::string> parse(std::string_view script);

private:
    explicit StatementParser(std::string_view script) : src_(script) {}

    void run();
    void copy_quoted(char quote);
    // Returns true when the word closed a trigger body and consumed input
    bool finish_word();
    bool close_trigger_body();
    void flush();

    std::string_view src_;
    size_t pos_ = 0;
    State state_ = State::Normal;
    State resume_ = State::Normal;

    std::string current_;
    std::string word_;
    std::string prev_word_;
    std::string prev2_word_;
    bool trigger_header_ = false;
    int case_depth_ = 0;

    std::vector<std::string> statements_;
};

} // namespace novelforge::db
