#include "log.h"
#include "cli.h"

Logger::Logger(std::ostream& out, bool enabled, bool use_colors)
    : out(out), enabled(enabled), use_colors(use_colors) {}

void Logger::write(const char* level, const char* color, Phase phase, const std::string& message)
{
    if (!enabled)
        return;
    if (use_colors)
    {
        out << color << level << colors::RESET << " " << colors::DIM << "[" << phase_name(phase) << "]"
            << colors::RESET << " " << message << "\n";
    }
    else
    {
        out << level << " [" << phase_name(phase) << "] " << message << "\n";
    }
}

void Logger::debug(Phase phase, const std::string& message) { write("debug", colors::DIM, phase, message); }

void Logger::info(Phase phase, const std::string& message) { write("info ", colors::CYAN, phase, message); }

void Logger::warn(Phase phase, const std::string& message) { write("warn ", colors::YELLOW, phase, message); }

void Logger::error(Phase phase, const std::string& message) { write("error", colors::RED, phase, message); }
