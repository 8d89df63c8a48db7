#pragma once

#include "error.h"
#include <ostream>
#include <string>

// Phase-tagged log sink. Owned by the host and handed to the pipeline through
// CompilerConfig; the compiler never keeps one of its own.
class Logger {
public:
    explicit Logger(std::ostream& out, bool enabled = true, bool use_colors = true);

    void debug(Phase phase, const std::string& message);
    void info(Phase phase, const std::string& message);
    void warn(Phase phase, const std::string& message);
    void error(Phase phase, const std::string& message);

    bool is_enabled() const { return enabled; }
    void set_enabled(bool value) { enabled = value; }

private:
    std::ostream& out;
    bool enabled;
    bool use_colors;

    void write(const char* level, const char* color, Phase phase, const std::string& message);
};
