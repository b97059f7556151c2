#pragma once

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <limits>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

// Result of a parse step
class Status {
  public:
    static Status OK() { return Status(); }
    static Status InvalidArgument(const std::string &msg) { return Status(msg); }

    bool IsOK() const { return m_ok; }
    std::string ToString() const { return m_ok ? "OK" : "Invalid argument: " + m_msg; }

  private:
    Status() : m_ok(true) {}
    explicit Status(const std::string &msg) : m_ok(false), m_msg(msg) {}

    bool m_ok;
    std::string m_msg;
};

// A named option bound to a field of a config struct
class Parameter {
  public:
    Parameter(const std::string &name, const std::string &default_value, bool required, const std::string &description)
        : m_name(name), m_default_value(default_value), m_required(required), m_description(description) {}
    virtual ~Parameter() = default;

    virtual Status Parse(const std::string &value) = 0;
    virtual std::string TypeName() const = 0;

    const std::string &Name() const { return m_name; }
    const std::string &DefaultValue() const { return m_default_value; }
    const std::string &Description() const { return m_description; }
    bool Required() const { return m_required; }

    // "app.epsilon" -> "EPSILON"
    std::string EnvName() const {
        std::string last = m_name.substr(m_name.find_last_of('.') + 1);
        std::transform(last.begin(), last.end(), last.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return last;
    }

  protected:
    Status _error(const std::string &value) const { return Status::InvalidArgument("cannot parse '" + value + "' as " + TypeName() + " for --" + m_name); }

  private:
    std::string m_name;
    std::string m_default_value;
    bool m_required;
    std::string m_description;
};

template <typename U> class UnsignedParameter : public Parameter {
  public:
    UnsignedParameter(const std::string &name, const std::string &default_value, U *target, bool required, const std::string &description)
        : Parameter(name, default_value, required, description), m_target(target) {}

    Status Parse(const std::string &value) override {
        if (value.empty() || value[0] == '-') return _error(value);
        char *end = nullptr;
        errno = 0;
        unsigned long long parsed = std::strtoull(value.c_str(), &end, 10);
        if (errno != 0 || *end != '\0' || parsed > std::numeric_limits<U>::max()) return _error(value);
        *m_target = static_cast<U>(parsed);
        return Status::OK();
    }

    std::string TypeName() const override { return sizeof(U) == 4 ? "uint32" : "uint64"; }

  private:
    U *m_target;
};

using UnsignedInt32Parameter = UnsignedParameter<uint32_t>;
using UnsignedInt64Parameter = UnsignedParameter<uint64_t>;

template <typename F> class FloatingParameter : public Parameter {
  public:
    FloatingParameter(const std::string &name, const std::string &default_value, F *target, bool required, const std::string &description)
        : Parameter(name, default_value, required, description), m_target(target) {}

    Status Parse(const std::string &value) override {
        if (value.empty()) return _error(value);
        char *end = nullptr;
        errno = 0;
        double parsed = std::strtod(value.c_str(), &end);
        if (errno != 0 || *end != '\0') return _error(value);
        *m_target = static_cast<F>(parsed);
        return Status::OK();
    }

    std::string TypeName() const override { return sizeof(F) == 4 ? "float" : "double"; }

  private:
    F *m_target;
};

using FloatParameter = FloatingParameter<float>;
using DoubleParameter = FloatingParameter<double>;

class StringParameter : public Parameter {
  public:
    StringParameter(const std::string &name, const std::string &default_value, std::string *target, bool required, const std::string &description)
        : Parameter(name, default_value, required, description), m_target(target) {}

    Status Parse(const std::string &value) override {
        *m_target = value;
        return Status::OK();
    }

    std::string TypeName() const override { return "string"; }

  private:
    std::string *m_target;
};

class BooleanParameter : public Parameter {
  public:
    BooleanParameter(const std::string &name, const std::string &default_value, bool *target, bool required, const std::string &description)
        : Parameter(name, default_value, required, description), m_target(target) {}

    Status Parse(const std::string &value) override {
        if (value == "true" || value == "1" || value == "yes") {
            *m_target = true;
        } else if (value == "false" || value == "0" || value == "no") {
            *m_target = false;
        } else {
            return _error(value);
        }
        return Status::OK();
    }

    std::string TypeName() const override { return "bool"; }

  private:
    bool *m_target;
};

// Registry of parameters. Values are resolved as: default, then environment variable
// (last name component upper-cased), then command line (--name value or --name=value).
class ConfigParser {
  public:
    // Takes ownership of the parameter
    void AddParameter(Parameter *parameter) { m_parameters.emplace_back(parameter); }

    Status ParseCommandLine(int argc, char **argv) {
        Status s = _apply_defaults_and_environment();
        if (!s.IsOK()) return s;

        std::map<std::string, bool> seen;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg.rfind("--", 0) != 0) return Status::InvalidArgument("unexpected positional argument '" + arg + "'");

            std::string key = arg.substr(2);
            std::string value;
            size_t eq = key.find('=');
            if (eq != std::string::npos) {
                value = key.substr(eq + 1);
                key = key.substr(0, eq);
            } else {
                Parameter *p = _find(key);
                if (p && p->TypeName() == "bool" && (i + 1 >= argc || std::strncmp(argv[i + 1], "--", 2) == 0)) {
                    value = "true";
                } else if (i + 1 < argc) {
                    value = argv[++i];
                } else {
                    return Status::InvalidArgument("missing value for --" + key);
                }
            }

            Parameter *p = _find(key);
            if (!p) return Status::InvalidArgument("unknown parameter --" + key);
            s = p->Parse(value);
            if (!s.IsOK()) return s;
            seen[key] = true;
        }

        for (const auto &p : m_parameters) {
            if (p->Required() && !seen.count(p->Name()) && !std::getenv(p->EnvName().c_str())) {
                return Status::InvalidArgument("missing required parameter --" + p->Name());
            }
        }
        return Status::OK();
    }

    void PrintUsage(std::ostream &os = std::cout) const {
        os << "Parameters:" << std::endl;
        for (const auto &p : m_parameters) {
            os << "  --" << p->Name() << " <" << p->TypeName() << ">" << (p->Required() ? " (required)" : "") << std::endl;
            os << "      " << p->Description() << " [default: " << p->DefaultValue() << ", env: " << p->EnvName() << "]" << std::endl;
        }
    }

    void PrintMarkdown(std::ostream &os = std::cout) const {
        os << "| Parameter | Type | Default | Environment | Description |" << std::endl;
        os << "|---|---|---|---|---|" << std::endl;
        for (const auto &p : m_parameters) {
            os << "| `--" << p->Name() << "` | " << p->TypeName() << " | `" << p->DefaultValue() << "` | `" << p->EnvName() << "` | " << p->Description() << " |"
               << std::endl;
        }
    }

  private:
    Status _apply_defaults_and_environment() {
        for (const auto &p : m_parameters) {
            Status s = p->Parse(p->DefaultValue());
            if (!s.IsOK()) return s;
            const char *env = std::getenv(p->EnvName().c_str());
            if (env) {
                s = p->Parse(env);
                if (!s.IsOK()) return s;
            }
        }
        return Status::OK();
    }

    Parameter *_find(const std::string &name) const {
        for (const auto &p : m_parameters) {
            if (p->Name() == name) return p.get();
        }
        return nullptr;
    }

    std::vector<std::unique_ptr<Parameter>> m_parameters;
};
