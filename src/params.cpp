#include "params.hpp"
#include <iostream>

static bool isOptionToken(const std::string& s) {
    return s.size() > 2 && s[0] == '-' && s[1] == '-';
}

ParamList::Option* ParamList::find(const std::string& name) {
    for (auto& opt : options_) {
        if (opt.name == name) return &opt;
    }
    return nullptr;
}

void ParamList::readArgs(int argc, char** argv) {
    helpRequested_ = false;
    for (int k = 1; k < argc; ++k) {
        const std::string tok(argv[k]);
        if (tok == "--help" || tok == "-h") {
            helpRequested_ = true;
            print_help();
            return;
        }
    }
    int i = 1;
    while (i < argc) {
        std::string tok(argv[i]);
        if (!isOptionToken(tok)) {
            throw std::invalid_argument("Unexpected argument: " + tok);
        }
        std::string name = tok.substr(2);
        std::string inlineVal;
        bool hasInline = false;
        size_t eq = name.find('=');
        if (eq != std::string::npos) {
            inlineVal = name.substr(eq + 1);
            name = name.substr(0, eq);
            hasInline = true;
        }
        Option* opt = find(name);
        if (opt == nullptr) {
            throw std::invalid_argument("Unknown option: --" + name);
        }
        ++i;
        std::vector<std::string> vals;
        if (hasInline) {
            vals.push_back(inlineVal);
        } else if (opt->isFlag) {
            // a bare flag means true
            if (i < argc && !isOptionToken(argv[i])) {
                vals.push_back(argv[i++]);
            } else {
                vals.push_back("true");
            }
        } else if (opt->isList) {
            while (i < argc && !isOptionToken(argv[i])) {
                vals.push_back(argv[i++]);
            }
        } else {
            if (i >= argc) {
                throw std::invalid_argument("Missing value for option --" + name);
            }
            vals.push_back(argv[i++]);
        }
        opt->set(vals);
        opt->seen = true;
    }
    for (const auto& opt : options_) {
        if (opt.required && !opt.seen) {
            throw std::invalid_argument("Required option --" + opt.name + " is missing");
        }
    }
}

bool ParamList::is_set(const std::string& name) const {
    for (const auto& opt : options_) {
        if (opt.name == name) return opt.seen;
    }
    return false;
}

void ParamList::print_options() const {
    std::cerr << "Options in effect:\n";
    for (const auto& opt : options_) {
        if (!opt.seen) continue;
        std::cerr << "  --" << opt.name << " " << opt.show() << "\n";
    }
}

void ParamList::print_help() const {
    std::cerr << "Available options:\n";
    for (const auto& opt : options_) {
        std::cerr << "  --" << opt.name;
        if (opt.required) std::cerr << " [required]";
        std::cerr << "\n      " << opt.desc;
        std::string cur = opt.show();
        if (!cur.empty()) std::cerr << " (default: " << cur << ")";
        std::cerr << "\n";
    }
}
