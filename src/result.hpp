#pragma once
#include <string>

// Outcome of one blocking step (connect, read a line, send).
enum class Outcome { Success, Failure, Interrupted, EndOfInput };

struct Result {
    Outcome     outcome{Outcome::Success};
    std::string reason;   // set on Failure

    static Result ok()                              { return {}; }
    static Result fail(const std::string& why)      { return {Outcome::Failure, why}; }
    static Result interrupted()                     { return {Outcome::Interrupted, ""}; }
    static Result end_of_input()                    { return {Outcome::EndOfInput, ""}; }

    bool is_ok() const { return outcome == Outcome::Success; }
};
