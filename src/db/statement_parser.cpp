#include "db/statement_parser.hpp"
#include "common/log.hpp"
#include <cctype>

namespace novelforge::db {

namespace {

const log::Logger logger{log::PARSER_LOGGER};

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

} // anonymous namespace

std::vector<std::string> StatementParser::parse(std::string_view script) {
    StatementParser parser(script);
    parser.run();
    logger.trace("Parsed {} statement(s) from {} byte(s)", parser.statements_.size(), script.size());
    return std::move(parser.statements_);
}

void StatementParser::run() {
    while (pos_ < src_.size()) {
        char c = src_[pos_];

        if (state_ == State::InLineComment) {
            if (c == '\n') {
                current_ += c;
                state_ = resume_;
            }
            ++pos_;
            continue;
        }

        if (c == '\'' || c == '"' || c == '`') {
            finish_word();
            copy_quoted(c);
            continue;
        }

        if (c == '-' && pos_ + 1 < src_.size() && src_[pos_ + 1] == '-') {
            finish_word();
            resume_ = state_;
            state_ = State::InLineComment;
            pos_ += 2;
            continue;
        }

        if (is_word_char(c)) {
            word_ += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            current_ += c;
            ++pos_;
            continue;
        }

        if (finish_word()) {
            continue;
        }

        if (c == ';' && state_ == State::Normal) {
            flush();
        } else {
            current_ += c;
        }
        ++pos_;
    }

    finish_word();
    flush();
}

void StatementParser::copy_quoted(char quote) {
    current_ += src_[pos_++];
    while (pos_ < src_.size()) {
        char c = src_[pos_++];
        current_ += c;
        if (c == quote) {
            // Doubled quote is an escaped quote character
            if (pos_ < src_.size() && src_[pos_] == quote) {
                current_ += src_[pos_++];
                continue;
            }
            return;
        }
    }
}

bool StatementParser::finish_word() {
    if (word_.empty()) {
        return false;
    }

    std::string word = std::move(word_);
    word_.clear();

    bool consumed = false;
    if (state_ == State::Normal) {
        if (word == "TRIGGER" &&
            (prev_word_ == "CREATE" ||
             (prev2_word_ == "CREATE" && (prev_word_ == "TEMP" || prev_word_ == "TEMPORARY")))) {
            trigger_header_ = true;
        } else if (word == "BEGIN" && trigger_header_) {
            state_ = State::InTriggerBody;
            case_depth_ = 0;
        }
    } else if (state_ == State::InTriggerBody) {
        if (word == "CASE") {
            ++case_depth_;
        } else if (word == "END") {
            if (case_depth_ > 0) {
                --case_depth_;
            } else {
                consumed = close_trigger_body();
            }
        }
    }

    if (!consumed) {
        prev2_word_ = std::move(prev_word_);
        prev_word_ = std::move(word);
    }
    return consumed;
}

bool StatementParser::close_trigger_body() {
    size_t look = pos_;
    while (look < src_.size() && is_space(src_[look])) {
        ++look;
    }
    if (look >= src_.size() || src_[look] != ';') {
        return false;
    }

    current_.append(src_.substr(pos_, look + 1 - pos_));
    pos_ = look + 1;
    state_ = State::Normal;
    flush();
    return true;
}

void StatementParser::flush() {
    auto statement = trim(current_);
    if (!statement.empty()) {
        statements_.emplace_back(statement);
    }
    current_.clear();
    prev_word_.clear();
    prev2_word_.clear();
    trigger_header_ = false;
    case_depth_ = 0;
}

} // namespace novelforge::db
