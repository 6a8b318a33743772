#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <fstream>
#include <string>
#include <unistd.h>
#include <optional>

#include "../fifo/constants.hpp"

#include "utils.hpp"

//  Returns a formatted timestamp ----------------------------------------------------------------------------------------------------------------------------------
std::string get_timestamp(const bool withTime) {
        const char* frm = withTime ? "%Y-%m-%d %H:%M:%S" : "%Y-%m-%d";
        auto now = std::chrono::system_clock::now();
        std::time_t tt = std::chrono::system_clock::to_time_t(now);
        std::tm local{};
        localtime_r(&tt, &local);
        char buf[20];
        std::strftime(buf, sizeof(buf), frm, &local);
        return std::string(buf);
}

//  String splitter -----------------------------------------------------------------------------------------------------------------------------------------------
std::vector<std::string> split(const std::string& s, const std::string& delim) {
        std::vector<std::string> parts;
        size_t pos = 0, prev = 0;
        while ((pos = s.find(delim, prev)) != std::string::npos) {
            parts.push_back(s.substr(prev, pos - prev));
            prev = pos + delim.length();
        }
        parts.push_back(s.substr(prev));
        return parts;
}

//  Whitespace trimmer --------------------------------------------------------------------------------------------------------------------------------------------
//  Unicode whitespace: ASCII blanks, the \x1c-\x1f separators, NEL, NBSP and the U+2000 block among others

static bool is_unicode_space(unsigned int cp) {
    return (cp >= 0x09 && cp <= 0x0D) || (cp >= 0x1C && cp <= 0x20) || cp == 0x85 || cp == 0xA0 || cp == 0x1680 ||
           (cp >= 0x2000 && cp <= 0x200A) || cp == 0x2028 || cp == 0x2029 || cp == 0x202F || cp == 0x205F || cp == 0x3000;
}

//  Length of the whitespace character starting at i, 0 if there is none (or the bytes are not UTF-8)
static size_t space_at(const std::string& s, size_t i, size_t end) {

    unsigned char c = static_cast<unsigned char>(s[i]);

    if (c < 0x80)
        return is_unicode_space(c) ? 1 : 0;

    size_t len;
    unsigned int cp;

    if ((c & 0xE0) == 0xC0) {
        len = 2;
        cp = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
        len = 3;
        cp = c & 0x0F;
    } else
        return 0;

    if (i + len > end)
        return 0;

    for (size_t k = 1; k < len; ++k) {
        unsigned char cc = static_cast<unsigned char>(s[i + k]);
        if ((cc & 0xC0) != 0x80)
            return 0;
        cp = (cp << 6) | (cc & 0x3F);
    }

    return is_unicode_space(cp) ? len : 0;
}

std::string trim(const std::string& s) {

    size_t first = 0;
    size_t last = s.size();

    while (first < last) {
        size_t len = space_at(s, first, last);
        if (!len)
            break;
        first += len;
    }

    while (last > first) {
        //  Back up to the lead byte of the last character
        size_t lead = last - 1;
        while (lead > first && last - lead < 3 && (static_cast<unsigned char>(s[lead]) & 0xC0) == 0x80)
            --lead;

        if (space_at(s, lead, last) != last - lead)
            break;
        last = lead;
    }

    return s.substr(first, last - first);
}

//  UTF-8 validator -----------------------------------------------------------------------------------------------------------------------------------------------
//  Rejects overlong forms, surrogates and code points above U+10FFFF
bool is_valid_utf8(const std::string& s) {

    size_t i = 0;
    const size_t n = s.size();

    while (i < n) {
        unsigned char c = static_cast<unsigned char>(s[i]);

        if (c < 0x80) {
            ++i;
            continue;
        }

        size_t len;
        unsigned int cp;

        if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else
            return false;

        if (i + len > n)
            return false;

        for (size_t k = 1; k < len; ++k) {
            unsigned char cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80)
                return false;
            cp = (cp << 6) | (cc & 0x3F);
        }

        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000))
            return false;

        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
            return false;

        i += len;
    }

    return true;
}

//  Logger -------------------------------------------------------------------------------------------------------------------------------------------------------
//  Prints a log line (if logging is enabled)
void log(const std::string& type, const std::string& msg) {
    if (logging_enabled) {
        std::cout << get_timestamp(true) << " [" << type << "] " << msg << std::endl;
    }
}

//  General shutdown handler -------------------------------------------------------------------------------------------------------------------------------------
void shutdown_handler(int signum) {

    static const char* const signals[] = {
        "HUP", "INT", "QUIT", "ILL", "TRAP", "ABRT/SIGIOT", "BUS", "FPE", "KILL", "USR1", "SEGV", "USR2", "PIPE",
        "ALRM", "TERM", "STKFLT", "CHLD", "CONT", "STOP", "TSTP", "TTIN", "TTOU", "URG", "XCPU", "XFSZ", "VTALRM",
        "PROF", "WINCH", "IO/SIGPOLL", "PWR/SIGLOST", "UNUSED/SIGSYS"
    };
    const int count = static_cast<int>(sizeof(signals) / sizeof(signals[0]));

    if (signum >= 1 && signum <= count) {
        std::cout << std::endl;
        log("SHUTDOWN", "Signal caught: SIG" + std::string(signals[signum - 1]));
    }
    else
        log("SHUTDOWN", "Signal caught: " + std::to_string(signum) + " (unknown)");
}

//  Checks if the program is already running (by PID) -----------------------------------------------------------------------------------------------------------
bool single_instance(const std::string& pid_file) {

    std::ifstream in(pid_file);
    pid_t old_pid = 0;

    if (in) {
        in >> old_pid;
        in.close();

        if (old_pid > 0 && old_pid != getpid() && (kill(old_pid, 0) == 0 || errno == EPERM)) {
            log("ERROR", "Program is already running. PID: " + std::to_string(old_pid));
            return false;
        }
    }

    std::ofstream out(pid_file, std::ios::trunc);
    if (!out) {
        log("ERROR", "PID file " + pid_file + " cannot be written");
        return false;
    }

    out << getpid() << std::endl;
    return true;
}

//	String conversion to integer ----------------------------------------------------------------------------------------------------------------
std::optional<int> string_to_int(
    const std::string& s,
    std::optional<int> min,
    std::optional<int> max
) {
    try {
        size_t idx = 0;
        int val = std::stoi(s, &idx);

        // Check if it's a number
        if (idx != s.size()) return std::nullopt;

        // Check minimum
        if (min && val < *min) return std::nullopt;

        // Check maximum
        if (max && val > *max) return std::nullopt;

        return val;

    } catch(const std::exception& e) {
        return std::nullopt;
    }
}
