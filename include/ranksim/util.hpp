#pragma once

#include <cstring>
#include <ctime>
#include <iostream>
#include <locale>
#include <string>
#include <sys/resource.h>
#include <sys/time.h>

namespace ranksim {

inline std::ostream& logger() {
    time_t t = std::time(nullptr);
    std::locale loc;
    const std::time_put<char>& tp = std::use_facet<std::time_put<char>>(loc);
    const char* fmt = "%F %T";
    tp.put(std::cerr, std::cerr, ' ', std::localtime(&t), fmt,
           fmt + strlen(fmt));
    return std::cerr << ": ";
}

inline double get_time_usecs() {
    timeval tv;
    gettimeofday(&tv, NULL);
    return double(tv.tv_sec) * 1000000 + double(tv.tv_usec);
}

inline double get_user_time_usecs() {
    rusage ru;
    getrusage(RUSAGE_SELF, &ru);
    return double(ru.ru_utime.tv_sec) * 1000000 + double(ru.ru_utime.tv_usec);
}

// one JSON object per line on stdout, closed on destruction:
// stats_line()("p", 0.9)("rbo", 0.42);
struct stats_line {
    stats_line() : m_first(true) {
        std::cout << "{";
    }

    ~stats_line() {
        std::cout << "}" << std::endl;
    }

    template <typename K, typename T>
    stats_line& operator()(K const& key, T const& value) {
        if (!m_first) {
            std::cout << ", ";
        } else {
            m_first = false;
        }

        emit(key);
        std::cout << ": ";
        emit(value);
        return *this;
    }

private:
    template <typename T>
    void emit(T const& v) const {
        std::cout << v;
    }

    // XXX properly escape strings
    void emit(const char* s) const {
        std::cout << '"' << s << '"';
    }

    void emit(std::string const& s) const {
        emit(s.c_str());
    }

    void emit(bool b) const {
        std::cout << (b ? "true" : "false");
    }

    bool m_first;
};

}  // namespace ranksim
