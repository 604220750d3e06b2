#pragma once

#include <map>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

#include "imports.h"

/**
 * Holder of one named argument and its default value.
 */
class arg {
    variant<bool, str, int, float> value;
    bool required;
    bool given = false;

    void print_help() const;

    void parse(span<str> & argv);

    friend class arg_list;

public:
    const str full_name;
    const str abbreviation;
    const str description;

    template <typename T>
    constexpr arg(T default_value, str full_name, str abbreviation, str description, bool required = false)
        : value{default_value}, required{required},
          full_name{full_name}, abbreviation{abbreviation}, description{description} {
        KOKORO_ASSERT(full_name[0] != '-');
        KOKORO_ASSERT(abbreviation[0] != '-');
    }

    template <typename T>
        requires is_same_v<T, bool> || is_same_v<T, str> || is_same_v<T, int> || is_same_v<T, float>
    // ReSharper disable once CppNonExplicitConversionOperator // We want this to automatically cast
    constexpr operator T() const { // NOLINT(*-explicit-constructor)
        return get<T>(value);
    }

    // Whether the value came from the command line rather than from the default.
    bool was_given() const { return given; }
};

class arg_list {
    vector<arg> args{};
    map<sv, size_t> full_names{};
    map<sv, size_t> abbreviations{};
    str usage;

public:
    explicit arg_list(str usage = "") : usage{usage} {}

    void add(const arg & x) {
        const size_t i{args.size()};
        args.push_back(x);
        KOKORO_ASSERT(!full_names.contains(args[i].full_name));
        full_names[args[i].full_name] = i;
        if (*args[i].abbreviation) {
            KOKORO_ASSERT(!abbreviations.contains(args[i].abbreviation));
            abbreviations[args[i].abbreviation] = i;
        }
    }

    void parse(int argc, str argv_[]);

    const arg & operator [](sv full_name) const noexcept {
        KOKORO_ASSERT(full_name[0] != '-');
        return args[full_names.at(full_name)];
    }

    bool contains(sv full_name) const { return full_names.contains(full_name); }

    // The value when it was passed on the command line, nothing otherwise.
    template <typename T>
    std::optional<T> given(sv full_name) const {
        const arg & a = (*this)[full_name];
        if (!a.was_given()) {
            return std::nullopt;
        }
        return static_cast<T>(a);
    }
};
