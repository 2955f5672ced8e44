#pragma once

#include <cstdint>
#include <functional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

// Command line options of the form --name [value ...]
class ParamList {
public:
    template<typename T>
    ParamList& add_option(const std::string& name, const std::string& desc, T& var, bool required = false) {
        Option opt;
        opt.name = name;
        opt.desc = desc;
        opt.required = required;
        opt.isFlag = std::is_same<T, bool>::value;
        opt.isList = false;
        opt.set = [&var, name](const std::vector<std::string>& vals) {
            if (vals.size() != 1) {
                throw std::invalid_argument("Option --" + name + " expects exactly one value");
            }
            parseValue(name, vals[0], var);
        };
        opt.show = [&var]() { return toString(var); };
        options_.push_back(std::move(opt));
        return *this;
    }

    template<typename T>
    ParamList& add_option(const std::string& name, const std::string& desc, std::vector<T>& var, bool required = false) {
        Option opt;
        opt.name = name;
        opt.desc = desc;
        opt.required = required;
        opt.isFlag = false;
        opt.isList = true;
        opt.set = [&var, name](const std::vector<std::string>& vals) {
            if (vals.empty()) {
                throw std::invalid_argument("Option --" + name + " expects at least one value");
            }
            var.clear();
            for (const auto& v : vals) {
                T x;
                parseValue(name, v, x);
                var.push_back(x);
            }
        };
        opt.show = [&var]() {
            std::string s;
            for (size_t i = 0; i < var.size(); ++i) {
                if (i > 0) s += " ";
                s += toString(var[i]);
            }
            return s;
        };
        options_.push_back(std::move(opt));
        return *this;
    }

    // argv[0] is the command name. --help (or -h) prints the option list and
    // returns without parsing or checking required options.
    void readArgs(int argc, char** argv);
    bool help_requested() const { return helpRequested_; }
    void print_options() const;
    void print_help() const;
    bool is_set(const std::string& name) const;

private:
    struct Option {
        std::string name, desc;
        bool required = false;
        bool isFlag = false;
        bool isList = false;
        bool seen = false;
        std::function<void(const std::vector<std::string>&)> set;
        std::function<std::string()> show;
    };
    std::vector<Option> options_;
    bool helpRequested_ = false;

    Option* find(const std::string& name);

    static void parseValue(const std::string& name, const std::string& s, std::string& v) { v = s; }
    static void parseValue(const std::string& name, const std::string& s, bool& v) {
        if (s == "1" || s == "true" || s == "TRUE" || s == "yes") v = true;
        else if (s == "0" || s == "false" || s == "FALSE" || s == "no") v = false;
        else throw std::invalid_argument("Invalid boolean for --" + name + ": " + s);
    }
    template<typename T>
    static typename std::enable_if<std::is_arithmetic<T>::value>::type
    parseValue(const std::string& name, const std::string& s, T& v) {
        std::istringstream iss(s);
        iss >> v;
        if (iss.fail() || !iss.eof()) {
            throw std::invalid_argument("Invalid value for --" + name + ": " + s);
        }
        if (std::is_unsigned<T>::value && !s.empty() && s[0] == '-') {
            throw std::invalid_argument("Negative value for --" + name + ": " + s);
        }
    }

    static std::string toString(const std::string& v) { return v; }
    static std::string toString(bool v) { return v ? "true" : "false"; }
    template<typename T>
    static typename std::enable_if<std::is_arithmetic<T>::value, std::string>::type
    toString(const T& v) {
        std::ostringstream oss;
        oss << v;
        return oss.str();
    }
};
