#include "input_script.hpp"

#include <cctype>
#include <iomanip>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace {

std::string trimCopy(const std::string& s) {
    size_t a = 0;
    while (a < s.size() && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
    size_t b = s.size();
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;
    return s.substr(a, b - a);
}

std::optional<uint64_t> parseU64(const std::string& s, int base) {
    if (s.empty() || s[0] == '-') return std::nullopt;
    try {
        size_t idx = 0;
        const unsigned long long v = std::stoull(s, &idx, base);
        if (idx != s.size()) return std::nullopt;
        return static_cast<uint64_t>(v);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

void setErr(std::string* err, const std::string& msg) {
    if (err) *err = msg;
}

std::string lineErr(const char* what, int lineNo) {
    return std::string("Input script parse error (") + what + ") line " + std::to_string(lineNo);
}

} // namespace

bool InputScriptWriter::open(const std::filesystem::path& path, const InputScriptMeta& meta, std::string* err) {
    close();
    f_.open(path, std::ios::out | std::ios::trunc);
    if (!f_) {
        setErr(err, "Failed to open input script for writing: " + path.string());
        return false;
    }

    f_ << "@cryptcrawl_input " << meta.formatVersion << "\n";
    f_ << "@game_version " << meta.gameVersion << "\n";
    f_ << "@seed " << meta.seed << "\n";
    f_ << "@difficulty " << difficultyName(meta.difficulty) << "\n";
    f_ << "@end_header\n";
    f_.flush();
    return true;
}

void InputScriptWriter::close() {
    if (f_.is_open()) {
        f_.flush();
        f_.close();
    }
}

void InputScriptWriter::writeLine_(const std::string& line) {
    if (!f_.is_open()) return;
    f_ << line << "\n";
}

void InputScriptWriter::writeAction(uint32_t tMs, Action a, int slot) {
    std::string line = std::to_string(tMs) + " A " + actionName(a);
    if (actionTakesSlot(a)) line += " " + std::to_string(slot);
    writeLine_(line);
}

void InputScriptWriter::writeStateHash(uint32_t tMs, uint64_t tick, uint64_t hash) {
    std::ostringstream ss;
    ss << tMs << " H " << tick << " ";
    ss << std::hex << std::setw(16) << std::setfill('0') << hash;
    writeLine_(ss.str());
}

bool parseInputScript(const std::string& text, InputScript& out, std::string* err) {
    out = InputScript{};

    std::istringstream f(text);
    bool inHeader = true;
    bool sawMagic = false;
    std::string line;
    int lineNo = 0;
    while (std::getline(f, line)) {
        ++lineNo;
        line = trimCopy(line);
        if (line.empty() || line[0] == '#') continue;

        if (inHeader) {
            if (line == "@end_header") {
                inHeader = false;
                continue;
            }
            if (line[0] != '@') {
                setErr(err, lineErr("expected header @key", lineNo));
                return false;
            }

            std::istringstream iss(line);
            std::string key;
            iss >> key;
            std::string value;
            std::getline(iss, value);
            value = trimCopy(value);

            if (key == "@cryptcrawl_input") {
                auto v = parseU64(value, 10);
                if (!v || *v == 0 || *v > 1) {
                    setErr(err, lineErr("unsupported format version", lineNo));
                    return false;
                }
                out.meta.formatVersion = static_cast<int>(*v);
                sawMagic = true;
            } else if (key == "@game_version") {
                out.meta.gameVersion = value;
            } else if (key == "@seed") {
                auto v = parseU64(value, 10);
                if (!v) {
                    setErr(err, lineErr("bad seed", lineNo));
                    return false;
                }
                out.meta.seed = *v;
            } else if (key == "@difficulty") {
                if (!parseDifficulty(value, out.meta.difficulty)) {
                    setErr(err, lineErr("bad difficulty", lineNo));
                    return false;
                }
            }
            // Unknown header keys are ignored.
            continue;
        }

        // <ms> CODE [payload...]
        std::istringstream iss(line);
        std::string msTok;
        std::string code;
        iss >> msTok >> code;
        auto ms = parseU64(msTok, 10);
        if (!ms || *ms > 0xFFFFFFFFull) {
            setErr(err, lineErr("missing time", lineNo));
            return false;
        }
        if (code.empty()) {
            setErr(err, lineErr("missing event code", lineNo));
            return false;
        }
        if (!out.events.empty() && *ms < out.events.back().tMs) {
            setErr(err, lineErr("time goes backwards", lineNo));
            return false;
        }

        ScriptEvent ev;
        ev.tMs = static_cast<uint32_t>(*ms);

        if (code == "A") {
            std::string id;
            if (!(iss >> id) || !parseAction(id, ev.action)) {
                setErr(err, lineErr("bad action", lineNo));
                return false;
            }
            if (actionTakesSlot(ev.action)) {
                int slot = 0;
                if (!(iss >> slot) || slot < 1 || slot > 9) {
                    setErr(err, lineErr("bad slot", lineNo));
                    return false;
                }
                ev.slot = slot;
            }
            ev.kind = ScriptEventType::Action;
            out.events.push_back(ev);
            continue;
        }
        if (code == "H") {
            std::string tickTok;
            std::string hex;
            iss >> tickTok >> hex;
            auto tick = parseU64(tickTok, 10);
            auto hv = parseU64(hex, 16);
            if (!tick || !hv) {
                setErr(err, lineErr("bad state hash", lineNo));
                return false;
            }
            ev.kind = ScriptEventType::StateHash;
            ev.tick = *tick;
            ev.hash = *hv;
            out.events.push_back(ev);
            continue;
        }

        // Unknown event codes are ignored.
    }

    if (!sawMagic) {
        setErr(err, "Input script parse error (missing @cryptcrawl_input)");
        return false;
    }
    if (inHeader) {
        setErr(err, "Input script parse error (missing @end_header)");
        return false;
    }
    return true;
}

bool loadInputScript(const std::filesystem::path& path, InputScript& out, std::string* err) {
    std::ifstream f(path);
    if (!f) {
        setErr(err, "Failed to open input script for reading: " + path.string());
        return false;
    }
    std::ostringstream buf;
    buf << f.rdbuf();
    return parseInputScript(buf.str(), out, err);
}
