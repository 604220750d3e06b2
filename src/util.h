#ifndef util_h
#define util_h

#include <chrono>
#include <ctime>
#include <string>
#include <vector>

#include "imports.h"

std::string strip(std::string target, std::string vals = " ");

// 12 random characters from a 57 symbol alphabet without look-alike characters, optionally prefixed.
std::string short_uuid(const std::string & prefix = "");

// Splits a duration into the (seconds, microseconds) pair that httplib's timeout setters take.
std::pair<time_t, time_t> to_sec_usec(std::chrono::duration<double> d);

double elapsed_ms(std::chrono::steady_clock::time_point start);

#endif
