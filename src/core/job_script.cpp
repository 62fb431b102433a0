#include "job_script.hpp"
#include <fmt/format.h>

void JobScript::push(StatementKind kind, const std::string& text, bool flag) {
    Statement s;
    s.kind = kind;
    s.text = text;
    s.flag = flag;
    statements_.push_back(std::move(s));
}

void JobScript::shebang() { push(StatementKind::Shebang); }

void JobScript::directive(const Directive& d) {
    Statement s;
    s.kind = StatementKind::Directive;
    s.directive = d;
    statements_.push_back(std::move(s));
}

void JobScript::change_dir(const std::string& dir) { push(StatementKind::ChangeDir, dir); }
void JobScript::setup(const std::string& text) { push(StatementKind::Setup, text); }
void JobScript::timestamp() { push(StatementKind::Timestamp); }
void JobScript::hostname() { push(StatementKind::Hostname); }
void JobScript::slot_index(const std::string& var) { push(StatementKind::SlotIndex, var); }
void JobScript::command(const std::string& text) { push(StatementKind::Command, text); }
void JobScript::fail_fast(bool on) { push(StatementKind::FailFast, "", on); }
void JobScript::background(const std::string& text) { push(StatementKind::Background, text); }
void JobScript::wait_all() { push(StatementKind::Wait); }

size_t JobScript::count(StatementKind kind) const {
    size_t n = 0;
    for (const auto& s : statements_) {
        if (s.kind == kind) n++;
    }
    return n;
}

const Directive* JobScript::find_directive(DirectiveKind kind) const {
    for (const auto& s : statements_) {
        if (s.kind == StatementKind::Directive && s.directive.kind == kind) {
            return &s.directive;
        }
    }
    return nullptr;
}

std::string JobScript::render(const SchedulerDialect& dialect) const {
    std::string out;
    for (const auto& s : statements_) {
        switch (s.kind) {
            case StatementKind::Shebang:
                out += "#!/bin/bash\n";
                break;
            case StatementKind::Directive:
                out += dialect.render(s.directive);
                break;
            case StatementKind::ChangeDir:
                out += fmt::format("cd {}\n", s.text);
                break;
            case StatementKind::Setup:
                if (!s.text.empty()) out += s.text + "\n";
                break;
            case StatementKind::Timestamp:
                out += "date\n";
                break;
            case StatementKind::Hostname:
                out += "hostname\n";
                break;
            case StatementKind::SlotIndex:
                out += fmt::format("{}={}\n", s.text, dialect.slot_variable());
                break;
            case StatementKind::Command:
                out += s.text + "\n";
                break;
            case StatementKind::FailFast:
                out += s.flag ? "set -e\n" : "set +e\n";
                break;
            case StatementKind::Background:
                out += s.text + " &\n";
                break;
            case StatementKind::Wait:
                out += "wait\n";
                break;
        }
    }
    return out;
}
