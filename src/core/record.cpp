// File: src/core/record.cpp
#include "core/record.hpp"
#include <algorithm>
#include <istream>
#include <ostream>

namespace geochron {

namespace {

void WriteString(std::ostream& out, const std::string& str) {
    uint64_t length = str.size();
    out.write(reinterpret_cast<const char*>(&length), sizeof(length));
    out.write(str.data(), static_cast<std::streamsize>(length));
}

std::string ReadString(std::istream& in) {
    uint64_t length = 0;
    in.read(reinterpret_cast<char*>(&length), sizeof(length));
    if (!in) {
        throw std::runtime_error("Truncated record");
    }
    std::string str(length, '\0');
    in.read(&str[0], static_cast<std::streamsize>(length));
    if (!in) {
        throw std::runtime_error("Truncated record");
    }
    return str;
}

void WriteProperties(std::ostream& out, const Properties& properties) {
    uint64_t count = properties.size();
    out.write(reinterpret_cast<const char*>(&count), sizeof(count));
    for (const auto& [key, value] : properties) {
        WriteString(out, key);
        WriteString(out, value);
    }
}

Properties ReadProperties(std::istream& in) {
    uint64_t count = 0;
    in.read(reinterpret_cast<char*>(&count), sizeof(count));
    if (!in) {
        throw std::runtime_error("Truncated record");
    }
    Properties properties;
    for (uint64_t i = 0; i < count; ++i) {
        std::string key = ReadString(in);
        properties[key] = ReadString(in);
    }
    return properties;
}

template<typename T>
void WritePod(std::ostream& out, const T& value) {
    out.write(reinterpret_cast<const char*>(&value), sizeof(value));
}

template<typename T>
T ReadPod(std::istream& in) {
    T value{};
    in.read(reinterpret_cast<char*>(&value), sizeof(value));
    if (!in) {
        throw std::runtime_error("Truncated record");
    }
    return value;
}

} // namespace

Record Record::MakeFeature(
        const std::string& database,
        const std::string& id,
        const Geometry& geometry,
        const Properties& properties,
        const Properties& provenance) {
    Record record;
    record.id = id;
    record.database = database;
    record.kind = RecordKind::FEATURE;
    record.geometry = geometry;
    record.bbox = ComputeBoundingBox(geometry);
    record.properties = properties;
    record.provenance = provenance;
    return record;
}

Record Record::MakePoint(
        const std::string& database,
        const std::string& series_id,
        const std::string& id,
        Timestamp timestamp,
        double value,
        const Properties& metadata,
        const Properties& provenance) {
    Record record;
    record.id = id;
    record.database = database;
    record.kind = RecordKind::TIME_SERIES;
    record.series_id = series_id;
    record.timestamp = timestamp;
    record.value = value;
    record.metadata = metadata;
    record.provenance = provenance;
    return record;
}

bool Record::operator==(const Record& other) const {
    if (id != other.id || database != other.database || kind != other.kind ||
        provenance != other.provenance) {
        return false;
    }

    if (kind == RecordKind::FEATURE) {
        return bbox == other.bbox && properties == other.properties &&
               geometry.type == other.geometry.type &&
               std::equal(geometry.positions.begin(), geometry.positions.end(),
                          other.geometry.positions.begin(), other.geometry.positions.end(),
                          [](const Position& a, const Position& b) {
                              return a.x == b.x && a.y == b.y;
                          });
    }

    return series_id == other.series_id && timestamp == other.timestamp &&
           value == other.value && metadata == other.metadata;
}

void Record::Serialize(std::ostream& out) const {
    WriteString(out, id);
    WriteString(out, database);
    WritePod(out, static_cast<uint8_t>(kind));

    if (kind == RecordKind::FEATURE) {
        geometry.Serialize(out);
        WritePod(out, bbox.minx);
        WritePod(out, bbox.miny);
        WritePod(out, bbox.maxx);
        WritePod(out, bbox.maxy);
        WriteProperties(out, properties);
    } else {
        WriteString(out, series_id);
        WritePod(out, timestamp);
        WritePod(out, value);
        WriteProperties(out, metadata);
    }

    WriteProperties(out, provenance);
}

Record Record::Deserialize(std::istream& in) {
    Record record;
    record.id = ReadString(in);
    record.database = ReadString(in);
    record.kind = static_cast<RecordKind>(ReadPod<uint8_t>(in));

    if (record.kind == RecordKind::FEATURE) {
        record.geometry = Geometry::Deserialize(in);
        record.bbox.minx = ReadPod<double>(in);
        record.bbox.miny = ReadPod<double>(in);
        record.bbox.maxx = ReadPod<double>(in);
        record.bbox.maxy = ReadPod<double>(in);
        record.properties = ReadProperties(in);
    } else {
        record.series_id = ReadString(in);
        record.timestamp = ReadPod<Timestamp>(in);
        record.value = ReadPod<double>(in);
        record.metadata = ReadProperties(in);
    }

    record.provenance = ReadProperties(in);
    return record;
}

void SortById(std::vector<Record>& records) {
    std::sort(records.begin(), records.end(),
              [](const Record& a, const Record& b) { return a.id < b.id; });
}

void SortByOrderingKey(std::vector<Record>& records) {
    std::sort(records.begin(), records.end(),
              [](const Record& a, const Record& b) {
                  if (a.timestamp != b.timestamp) {
                      return a.timestamp < b.timestamp;
                  }
                  return a.id < b.id;
              });
}

} // namespace geochron
