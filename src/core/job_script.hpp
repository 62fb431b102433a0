#pragma once

#include <string>
#include <vector>
#include <core/scheduler_dialect.hpp>

enum class StatementKind {
    Shebang,
    Directive,
    ChangeDir,
    Setup,        // environment setup, emitted verbatim
    Timestamp,
    Hostname,
    SlotIndex,    // text = shell variable receiving the array slot id
    Command,
    FailFast,     // flag = on/off
    Background,   // command launched with '&'
    Wait,         // join barrier for all background commands
};

struct Statement {
    StatementKind kind = StatementKind::Command;
    std::string text;
    Directive directive;
    bool flag = false;
};

// Ordered, typed representation of a generated job script. Planning code
// appends statements; render() is the only place script text is produced.
class JobScript {
public:
    void shebang();
    void directive(const Directive& d);
    void change_dir(const std::string& dir);
    void setup(const std::string& text);
    void timestamp();
    void hostname();
    void slot_index(const std::string& var);
    void command(const std::string& text);
    void fail_fast(bool on);
    void background(const std::string& text);
    void wait_all();

    const std::vector<Statement>& statements() const { return statements_; }
    size_t count(StatementKind kind) const;

    // First directive of the given kind, or nullptr.
    const Directive* find_directive(DirectiveKind kind) const;

    std::string render(const SchedulerDialect& dialect) const;

private:
    std::vector<Statement> statements_;

    void push(StatementKind kind, const std::string& text = "", bool flag = false);
};
