#include "replay/Serialization.hpp"

#include <limits>
#include <map>
#include <type_traits>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace blockdrop::replay {

namespace {
    using Fields = std::map<std::string, std::string>;

    // "TYPE;k=v;k=v" -> type + fields. False on a malformed pair.
    bool splitLine(const std::string& line, std::string& type, Fields& fields) {
        std::istringstream is(line);
        if (!std::getline(is, type, ';') || type.empty()) {
            return false;
        }

        std::string pair;
        while (std::getline(is, pair, ';')) {
            const auto eq = pair.find('=');
            if (eq == std::string::npos || eq == 0) {
                return false;
            }
            fields[pair.substr(0, eq)] = pair.substr(eq + 1);
        }
        return true;
    }

    std::optional<std::string> field(const Fields& fields, const std::string& key) {
        auto it = fields.find(key);
        if (it == fields.end()) return std::nullopt;
        return it->second;
    }

    // std::stoll accepts trailing junk ("12abc") and std::stoull negative
    // numbers ("-1" wraps); we accept neither, nor values that do not fit T
    template <typename T>
    std::optional<T> numberField(const Fields& fields, const std::string& key) {
        auto raw = field(fields, key);
        if (!raw || raw->empty()) return std::nullopt;
        try {
            std::size_t used = 0;
            if constexpr (std::is_unsigned<T>::value) {
                if ((*raw)[0] == '-') return std::nullopt;
                const unsigned long long value = std::stoull(*raw, &used);
                if (used != raw->size()) return std::nullopt;
                if (value > std::numeric_limits<T>::max()) return std::nullopt;
                return static_cast<T>(value);
            } else {
                const long long value = std::stoll(*raw, &used);
                if (used != raw->size()) return std::nullopt;
                if (value < std::numeric_limits<T>::min() ||
                    value > std::numeric_limits<T>::max()) {
                    return std::nullopt;
                }
                return static_cast<T>(value);
            }
        } catch (const std::exception&) {
            return std::nullopt; // not a number, or out of range for stoll/stoull
        }
    }

    std::optional<core::TetrominoType> shapeField(const Fields& fields, const std::string& key) {
        auto raw = field(fields, key);
        if (!raw) return std::nullopt;
        return core::tetrominoTypeFromString(*raw);
    }

    std::optional<ReplayMetadata> parseMetadata(const Fields& fields) {
        ReplayMetadata m;

        auto version = field(fields, "version");
        auto start   = numberField<std::int64_t>(fields, "startTimestamp");
        auto width   = numberField<int>(fields, "boardWidth");
        auto height  = numberField<int>(fields, "boardHeight");
        auto first   = shapeField(fields, "firstShape");
        auto second  = shapeField(fields, "secondShape");
        auto score   = numberField<std::uint64_t>(fields, "finalScore");
        auto level   = numberField<int>(fields, "finalLevel");
        auto lines   = numberField<int>(fields, "finalLines");
        auto dur     = numberField<std::int64_t>(fields, "durationMs");

        if (!version || !start || !width || !height || !first || !second ||
            !score || !level || !lines || !dur) {
            return std::nullopt;
        }
        if (*width <= 0 || *height <= 0) {
            return std::nullopt;
        }

        // Older replays have no start level: they were all played from level 1
        int startLevel = 1;
        if (field(fields, "startLevel")) {
            auto parsed = numberField<int>(fields, "startLevel");
            if (!parsed || *parsed < 1) return std::nullopt;
            startLevel = *parsed;
        }

        m.version        = *version;
        m.startTimestamp = *start;
        m.boardWidth     = *width;
        m.boardHeight    = *height;
        m.startLevel     = startLevel;
        m.firstShape     = *first;
        m.secondShape    = *second;
        m.finalScore     = *score;
        m.finalLevel     = *level;
        m.finalLines     = *lines;
        m.durationMs     = *dur;
        return m;
    }

    std::optional<ReplayEvent> parseEvent(const Fields& fields) {
        auto kind  = field(fields, "kind");
        auto frame = numberField<Frame>(fields, "frame");
        if (!kind || !frame) {
            return std::nullopt;
        }

        if (*kind == "PlayerInput") {
            auto name = field(fields, "input");
            if (!name) return std::nullopt;
            auto input = core::inputFromString(*name);
            if (!input) return std::nullopt;
            return ReplayEvent{PlayerInput{*input, *frame}};
        }
        if (*kind == "PieceSpawn") {
            auto shape = shapeField(fields, "shape");
            if (!shape) return std::nullopt;
            return ReplayEvent{PieceSpawn{*shape, *frame}};
        }
        return std::nullopt;
    }
}

std::string serializeEvent(const ReplayEvent& event)
{
    std::ostringstream os;
    os << "EVENT;";

    if (const auto* in = std::get_if<PlayerInput>(&event)) {
        os << "kind=PlayerInput;input=" << core::toString(in->input)
           << ";frame=" << in->frame;
    } else {
        const auto& spawn = std::get<PieceSpawn>(event);
        os << "kind=PieceSpawn;shape=" << core::toString(spawn.shape)
           << ";frame=" << spawn.frame;
    }
    return os.str();
}

std::string serialize(const ReplayData& replay)
{
    const auto& m = replay.metadata;

    std::ostringstream os;
    os << "METADATA;"
       << "version=" << m.version << ';'
       << "startTimestamp=" << m.startTimestamp << ';'
       << "boardWidth=" << m.boardWidth << ';'
       << "boardHeight=" << m.boardHeight << ';'
       << "startLevel=" << m.startLevel << ';'
       << "firstShape=" << core::toString(m.firstShape) << ';'
       << "secondShape=" << core::toString(m.secondShape) << ';'
       << "finalScore=" << m.finalScore << ';'
       << "finalLevel=" << m.finalLevel << ';'
       << "finalLines=" << m.finalLines << ';'
       << "durationMs=" << m.durationMs << '\n';

    for (const auto& event : replay.events) {
        os << serializeEvent(event) << '\n';
    }
    return os.str();
}

std::optional<ReplayEvent> deserializeEvent(const std::string& line)
{
    std::string type;
    Fields fields;
    if (!splitLine(line, type, fields) || type != "EVENT") {
        return std::nullopt;
    }
    return parseEvent(fields);
}

std::optional<ReplayData> deserialize(const std::string& text)
{
    std::istringstream is(text);
    std::string line;

    ReplayData data;
    bool haveMetadata = false;

    while (std::getline(is, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }

        std::string type;
        Fields fields;
        if (!splitLine(line, type, fields)) {
            return std::nullopt;
        }

        if (type == "METADATA") {
            if (haveMetadata) return std::nullopt;
            auto metadata = parseMetadata(fields);
            if (!metadata) return std::nullopt;
            data.metadata = std::move(*metadata);
            haveMetadata = true;
        } else if (type == "EVENT") {
            if (!haveMetadata) return std::nullopt;
            auto event = parseEvent(fields);
            if (!event) return std::nullopt;
            if (!data.events.empty() && frameOf(*event) < frameOf(data.events.back())) {
                return std::nullopt; // frames must not go backwards
            }
            data.events.push_back(std::move(*event));
        } else {
            return std::nullopt;
        }
    }

    if (!haveMetadata) {
        return std::nullopt;
    }
    return data;
}

} // namespace blockdrop::replay
