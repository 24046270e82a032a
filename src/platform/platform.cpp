#include "platform.hpp"
#include <cstdlib>
#include <iostream>
#include <termios.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
    const char* home = std::getenv("HOME");
    if (!home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    return fs::temp_directory_path();
}

std::string read_secret(const std::string& prompt) {
    std::cout << prompt << std::flush;

    struct termios orig;
    bool is_tty = isatty(STDIN_FILENO) && tcgetattr(STDIN_FILENO, &orig) == 0;
    if (is_tty) {
        struct termios noecho = orig;
        noecho.c_lflag &= ~ECHO;
        tcsetattr(STDIN_FILENO, TCSANOW, &noecho);
    }

    std::string line;
    std::getline(std::cin, line);

    if (is_tty) {
        tcsetattr(STDIN_FILENO, TCSANOW, &orig);
        std::cout << "\n";
    }
    return line;
}

} // namespace platform
