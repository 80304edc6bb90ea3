#include "game_save.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace {

// CRC32 of the entire payload (all bytes up to but excluding the CRC field).
uint32_t crc32(const uint8_t* data, size_t n) {
    static uint32_t table[256];
    static bool inited = false;
    if (!inited) {
        for (uint32_t i = 0; i < 256; ++i) {
            uint32_t c = i;
            for (int k = 0; k < 8; ++k) {
                c = (c & 1u) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
            }
            table[i] = c;
        }
        inited = true;
    }

    uint32_t crc = 0xFFFFFFFFu;
    for (size_t i = 0; i < n; ++i) {
        crc = table[(crc ^ data[i]) & 0xFFu] ^ (crc >> 8);
    }
    return crc ^ 0xFFFFFFFFu;
}

uint32_t readU32LE(const uint8_t* p) {
    return static_cast<uint32_t>(p[0])
        | (static_cast<uint32_t>(p[1]) << 8)
        | (static_cast<uint32_t>(p[2]) << 16)
        | (static_cast<uint32_t>(p[3]) << 24);
}

void appendU32LE(std::string& s, uint32_t v) {
    char b[4];
    b[0] = static_cast<char>(v & 0xFFu);
    b[1] = static_cast<char>((v >> 8) & 0xFFu);
    b[2] = static_cast<char>((v >> 16) & 0xFFu);
    b[3] = static_cast<char>((v >> 24) & 0xFFu);
    s.append(b, 4);
}

template <typename T>
void writePod(std::ostream& out, const T& v) {
    out.write(reinterpret_cast<const char*>(&v), static_cast<std::streamsize>(sizeof(T)));
}

template <typename T>
bool readPod(std::istream& in, T& v) {
    return static_cast<bool>(in.read(reinterpret_cast<char*>(&v), static_cast<std::streamsize>(sizeof(T))));
}

void writeString(std::ostream& out, const std::string& s) {
    uint32_t len = static_cast<uint32_t>(s.size());
    writePod(out, len);
    if (len) out.write(s.data(), static_cast<std::streamsize>(len));
}

// Strings longer than this are treated as corruption.
constexpr uint32_t MAX_STRING_LEN = 4096;
constexpr uint32_t MAX_LIST_LEN = 256;

bool readString(std::istream& in, std::string& s) {
    uint32_t len = 0;
    if (!readPod(in, len)) return false;
    if (len > MAX_STRING_LEN) return false;
    s.assign(len, '\0');
    if (len) {
        if (!in.read(s.data(), static_cast<std::streamsize>(len))) return false;
    }
    return true;
}

void writeStats(std::ostream& out, const PlayerStats& st) {
    writePod(out, st.attackDamage);
    writePod(out, st.attackLength);
    writePod(out, st.attackWidth);
    writePod(out, st.dashDistance);
    writePod(out, st.health);
    writePod(out, st.maxHealth);
    writePod(out, st.gold);
    writePod(out, st.enemiesKilled);
}

bool readStats(std::istream& in, PlayerStats& st) {
    return readPod(in, st.attackDamage) && readPod(in, st.attackLength) && readPod(in, st.attackWidth) &&
           readPod(in, st.dashDistance) && readPod(in, st.health) && readPod(in, st.maxHealth) &&
           readPod(in, st.gold) && readPod(in, st.enemiesKilled);
}

void setErr(std::string* err, const std::string& msg) {
    if (err) *err = msg;
}

} // namespace

GameSave makeSave(const World& w) {
    const Player& p = w.player();
    GameSave s;
    s.playerName = p.name;
    s.stats.attackDamage = p.attackDamage;
    s.stats.attackLength = p.attackLength;
    s.stats.attackWidth = p.attackWidth;
    s.stats.dashDistance = p.dashDistance;
    s.stats.health = p.hp;
    s.stats.maxHealth = p.maxHp;
    s.stats.gold = p.gold;
    s.stats.enemiesKilled = p.enemiesKilled;
    s.floorLevel = w.floorLevel();
    s.maxLevels = w.maxLevels();
    s.position = p.pos;
    s.difficulty = difficultyName(w.difficulty());
    s.timeElapsed = w.now();
    s.floorSeed = w.floorSeed();

    for (const auto& wp : p.weapons.weapons()) s.weapons.push_back(wp.name);
    s.currentWeapon = static_cast<uint32_t>(p.weapons.currentIndex());
    for (const auto& c : p.consumables.stacks()) {
        SavedConsumable sc;
        sc.kind = static_cast<uint8_t>(c.kind);
        sc.quantity = c.quantity;
        s.consumables.push_back(sc);
    }

    for (int i = 0; i < SKILL_PATH_COUNT; ++i) s.skillLevels[static_cast<size_t>(i)] = p.skills.levels()[static_cast<size_t>(i)];
    s.chosenPath = p.skills.chosen() ? static_cast<int32_t>(*p.skills.chosen()) : -1;
    s.ultimateKind = static_cast<uint8_t>(p.ultimate.kind());
    return s;
}

WorldConfig configFromSave(const GameSave& s, const WorldConfig& base) {
    WorldConfig cfg = base;
    Difficulty d = Difficulty::Normal;
    cfg.difficulty = parseDifficulty(s.difficulty, d) ? d : Difficulty::Normal;
    cfg.seed = s.floorSeed;
    if (!s.playerName.empty()) cfg.playerName = s.playerName;
    return cfg;
}

void applySave(World& w, const GameSave& s) {
    const int level = clampi(s.floorLevel, 1, w.maxLevels());
    w.startFloor(level, s.floorSeed);
    w.setElapsed(std::max(0.0, s.timeElapsed));

    Player& p = w.player();
    if (!s.playerName.empty()) p.name = s.playerName;

    p.attackDamage = std::max(1, s.stats.attackDamage);
    p.attackLength = std::max(1, s.stats.attackLength);
    p.attackWidth = std::max(1, s.stats.attackWidth);
    p.dashDistance = std::max(1, s.stats.dashDistance);
    std::array<int, SKILL_PATH_COUNT> levels{};
    for (size_t i = 0; i < levels.size(); ++i) levels[i] = s.skillLevels[i];
    std::optional<SkillPath> chosen;
    if (s.chosenPath >= 0 && s.chosenPath < SKILL_PATH_COUNT) chosen = static_cast<SkillPath>(s.chosenPath);
    p.skills.restore(levels, chosen);

    // Max HP follows the restored ranks; the saved HP is kept as is.
    p.maxHp = p.skillMaxHp();
    p.setHp(s.stats.health);
    p.gold = s.stats.gold;
    p.enemiesKilled = s.stats.enemiesKilled;

    std::vector<Weapon> weapons;
    for (const auto& name : s.weapons) {
        if (weapons.size() >= WeaponInventory::MAX_WEAPONS) break;
        if (const Weapon* wp = findWeapon(name)) weapons.push_back(*wp);
    }
    if (!weapons.empty()) p.weapons.assign(std::move(weapons), s.currentWeapon);

    p.consumables.clear();
    for (const auto& c : s.consumables) {
        if (c.kind >= CONSUMABLE_KIND_COUNT || c.quantity <= 0) continue;
        const ConsumableKind k = static_cast<ConsumableKind>(c.kind);
        if (isStackable(k)) {
            p.consumables.add(k, c.quantity);
        } else {
            for (int i = 0; i < c.quantity; ++i) p.consumables.add(k, 1);
        }
    }


    const UltimateKind uk = s.ultimateKind <= static_cast<uint8_t>(UltimateKind::Ghost)
        ? static_cast<UltimateKind>(s.ultimateKind)
        : UltimateKind::Shockwave;
    p.ultimate.setKind(uk);

    Vec2i pos = s.position;
    if (!w.floor().isWalkable(pos)) {
        if (auto near = w.floor().nearestWalkable(pos)) pos = *near;
        else pos = p.pos;
    }
    w.setPlayerPosition(pos);
}

std::string encodeSave(const GameSave& s) {
    std::ostringstream mem(std::ios::binary | std::ios::out);

    writePod(mem, SAVE_MAGIC);
    writePod(mem, SAVE_VERSION);

    writeString(mem, s.playerName);
    writeStats(mem, s.stats);
    writePod(mem, s.floorLevel);
    writePod(mem, s.maxLevels);
    writePod(mem, static_cast<int32_t>(s.position.x));
    writePod(mem, static_cast<int32_t>(s.position.y));
    writeString(mem, s.difficulty);
    writePod(mem, s.timeElapsed);
    writePod(mem, s.floorSeed);

    writePod(mem, static_cast<uint32_t>(s.weapons.size()));
    for (const auto& name : s.weapons) writeString(mem, name);
    writePod(mem, s.currentWeapon);

    writePod(mem, static_cast<uint32_t>(s.consumables.size()));
    for (const auto& c : s.consumables) {
        writePod(mem, c.kind);
        writePod(mem, c.quantity);
    }

    for (int32_t lvl : s.skillLevels) writePod(mem, lvl);
    writePod(mem, s.chosenPath);
    writePod(mem, s.ultimateKind);

    std::string payload = mem.str();
    const uint32_t c = crc32(reinterpret_cast<const uint8_t*>(payload.data()), payload.size());
    appendU32LE(payload, c);
    return payload;
}

bool decodeSave(const std::string& bytes, GameSave& out, std::string* err) {
    if (bytes.size() < 12u) {
        setErr(err, "SAVE FILE IS CORRUPTED OR TRUNCATED.");
        return false;
    }

    const auto* raw = reinterpret_cast<const uint8_t*>(bytes.data());
    const uint32_t magic = readU32LE(raw);
    const uint32_t version = readU32LE(raw + 4);
    if (magic != SAVE_MAGIC || version == 0u || version > SAVE_VERSION) {
        setErr(err, "SAVE FILE IS INVALID OR FROM ANOTHER VERSION.");
        return false;
    }

    const uint32_t storedCrc = readU32LE(raw + bytes.size() - 4u);
    const uint32_t computedCrc = crc32(raw, bytes.size() - 4u);
    if (storedCrc != computedCrc) {
        setErr(err, "SAVE FILE FAILED INTEGRITY CHECK (CRC MISMATCH).");
        return false;
    }

    std::istringstream in(bytes.substr(8, bytes.size() - 12u), std::ios::binary);
    GameSave s;
    int32_t px = 0;
    int32_t py = 0;
    uint32_t weaponCount = 0;
    uint32_t consumableCount = 0;

    bool ok = readString(in, s.playerName) && readStats(in, s.stats) && readPod(in, s.floorLevel) &&
              readPod(in, s.maxLevels) && readPod(in, px) && readPod(in, py) && readString(in, s.difficulty) &&
              readPod(in, s.timeElapsed) && readPod(in, s.floorSeed) && readPod(in, weaponCount) &&
              weaponCount <= MAX_LIST_LEN;
    for (uint32_t i = 0; ok && i < weaponCount; ++i) {
        std::string name;
        ok = readString(in, name);
        if (ok) s.weapons.push_back(std::move(name));
    }
    ok = ok && readPod(in, s.currentWeapon) && readPod(in, consumableCount) && consumableCount <= MAX_LIST_LEN;
    for (uint32_t i = 0; ok && i < consumableCount; ++i) {
        SavedConsumable c;
        ok = readPod(in, c.kind) && readPod(in, c.quantity);
        if (ok) s.consumables.push_back(c);
    }
    for (size_t i = 0; ok && i < s.skillLevels.size(); ++i) ok = readPod(in, s.skillLevels[i]);
    ok = ok && readPod(in, s.chosenPath) && readPod(in, s.ultimateKind);

    if (!ok) {
        setErr(err, "SAVE FILE IS CORRUPTED OR TRUNCATED.");
        return false;
    }

    s.position = {px, py};
    out = std::move(s);
    return true;
}

bool saveGameToFile(const std::string& path, const GameSave& s, std::string* err) {
    std::filesystem::path p(path);
    std::filesystem::path dir = p.parent_path();
    if (!dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
    }

    const std::string payload = encodeSave(s);

    // Write to a temporary file first, then replace the target.
    std::filesystem::path tmp = p.string() + ".tmp";
    std::ofstream out(tmp, std::ios::binary);
    if (!out) {
        setErr(err, "FAILED TO SAVE (CANNOT OPEN FILE).");
        return false;
    }

    out.write(payload.data(), static_cast<std::streamsize>(payload.size()));
    out.flush();
    if (!out.good()) {
        setErr(err, "FAILED TO SAVE (WRITE ERROR).");
        out.close();
        std::error_code ec;
        std::filesystem::remove(tmp, ec);
        return false;
    }
    out.close();

    std::error_code ec;
    std::filesystem::rename(tmp, p, ec);
    if (ec) {
        // On Windows, rename fails if destination exists; remove then retry.
        std::error_code ec2;
        std::filesystem::remove(p, ec2);
        ec.clear();
        std::filesystem::rename(tmp, p, ec);
    }
    if (ec) {
        std::error_code ec2;
        std::filesystem::remove(tmp, ec2);
        setErr(err, "FAILED TO SAVE (CANNOT REPLACE FILE).");
        return false;
    }
    return true;
}

bool loadGameFromFile(const std::string& path, GameSave& out, std::string* err) {
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        setErr(err, "NO SAVE FILE FOUND.");
        return false;
    }

    std::ostringstream buf;
    buf << f.rdbuf();
    return decodeSave(buf.str(), out, err);
}
