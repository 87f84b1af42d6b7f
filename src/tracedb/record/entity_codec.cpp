#include "tracedb/record/entity_codec.h"

#include <string>
#include <type_traits>

namespace tracedb {
namespace record {

namespace {

constexpr uint8_t kValueMagic = 'V';
constexpr uint8_t kEntityMagic = 'E';
constexpr uint8_t kHasFields = 0x01;
constexpr uint8_t kHasDataBinary = 0x02;

// Fixed-width integers are written big-endian
template<typename T>
void put_raw(core::Bytes& out, T value) {
    using U = typename std::make_unsigned<T>::type;
    const U bits = static_cast<U>(value);
    for (int shift = static_cast<int>(sizeof(T) - 1) * 8; shift >= 0; shift -= 8) {
        out.push_back(static_cast<uint8_t>(bits >> shift));
    }
}

void put_bytes(core::Bytes& out, const uint8_t* data, size_t size) {
    put_raw<uint32_t>(out, static_cast<uint32_t>(size));
    out.insert(out.end(), data, data + size);
}

void put_string(core::Bytes& out, const std::string& s) {
    put_bytes(out, reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

void put_field_value(core::Bytes& out, const core::FieldValue& value) {
    using Tag = EntityCodec::ValueTag;
    if (const auto* s = std::get_if<std::string>(&value)) {
        out.push_back(static_cast<uint8_t>(Tag::STR));
        put_string(out, *s);
    } else if (const auto* i = std::get_if<int64_t>(&value)) {
        out.push_back(static_cast<uint8_t>(Tag::INT));
        put_raw<int64_t>(out, *i);
    } else if (const auto* sa = std::get_if<std::vector<std::string>>(&value)) {
        out.push_back(static_cast<uint8_t>(Tag::STR_ARRAY));
        put_raw<uint32_t>(out, static_cast<uint32_t>(sa->size()));
        for (const auto& s : *sa) {
            put_string(out, s);
        }
    } else if (const auto* ia = std::get_if<std::vector<int64_t>>(&value)) {
        out.push_back(static_cast<uint8_t>(Tag::INT_ARRAY));
        put_raw<uint32_t>(out, static_cast<uint32_t>(ia->size()));
        for (auto v : *ia) {
            put_raw<int64_t>(out, v);
        }
    } else {
        out.push_back(static_cast<uint8_t>(Tag::NONE));
    }
}

// Bounds-checked cursor over an encoded record
class Reader {
public:
    explicit Reader(const core::Bytes& data) : data_(data), offset_(0) {}

    template<typename T>
    bool read_raw(T& value) {
        if (offset_ + sizeof(T) > data_.size()) {
            return false;
        }
        using U = typename std::make_unsigned<T>::type;
        U bits = 0;
        for (size_t i = 0; i < sizeof(T); ++i) {
            bits = static_cast<U>((static_cast<uint64_t>(bits) << 8) | data_[offset_ + i]);
        }
        value = static_cast<T>(bits);
        offset_ += sizeof(T);
        return true;
    }

    bool read_bytes(core::Bytes& out) {
        uint32_t len;
        if (!read_raw(len) || offset_ + len > data_.size()) {
            return false;
        }
        out.assign(data_.begin() + offset_, data_.begin() + offset_ + len);
        offset_ += len;
        return true;
    }

    bool read_string(std::string& out) {
        uint32_t len;
        if (!read_raw(len) || offset_ + len > data_.size()) {
            return false;
        }
        out.assign(reinterpret_cast<const char*>(data_.data() + offset_), len);
        offset_ += len;
        return true;
    }

    // Rejects element counts that could not fit in what is left
    bool read_count(uint32_t& count, size_t min_element_size) {
        return read_raw(count) && static_cast<uint64_t>(count) * min_element_size <= remaining();
    }

    bool read_field_value(core::FieldValue& value) {
        uint8_t tag;
        if (!read_raw(tag)) {
            return false;
        }
        switch (static_cast<EntityCodec::ValueTag>(tag)) {
            case EntityCodec::ValueTag::NONE:
                value = std::monostate{};
                return true;
            case EntityCodec::ValueTag::STR: {
                std::string s;
                if (!read_string(s)) return false;
                value = std::move(s);
                return true;
            }
            case EntityCodec::ValueTag::INT: {
                int64_t i;
                if (!read_raw(i)) return false;
                value = i;
                return true;
            }
            case EntityCodec::ValueTag::STR_ARRAY: {
                uint32_t count;
                if (!read_count(count, sizeof(uint32_t))) return false;
                std::vector<std::string> items(count);
                for (auto& item : items) {
                    if (!read_string(item)) return false;
                }
                value = std::move(items);
                return true;
            }
            case EntityCodec::ValueTag::INT_ARRAY: {
                uint32_t count;
                if (!read_count(count, sizeof(int64_t))) return false;
                std::vector<int64_t> items(count);
                for (auto& item : items) {
                    if (!read_raw(item)) return false;
                }
                value = std::move(items);
                return true;
            }
        }
        return false;
    }

    size_t offset() const { return offset_; }
    size_t remaining() const { return data_.size() - offset_; }
    bool done() const { return offset_ == data_.size(); }

private:
    const core::Bytes& data_;
    size_t offset_;
};

std::unique_ptr<core::Error> corrupted(const char* what, const Reader& reader) {
    return std::make_unique<core::CorruptedRecordError>(
        std::string(what) + " at offset " + std::to_string(reader.offset()));
}

} // namespace

core::Bytes EntityCodec::encode_value(const core::EntityValue& value) {
    core::Bytes out;
    out.push_back(kValueMagic);
    put_bytes(out, value.entity_id.data(), value.entity_id.size());
    put_raw<uint64_t>(out, value.timestamp_nanoseconds);
    put_raw<uint32_t>(out, static_cast<uint32_t>(value.fields.size()));
    for (const auto& field : value.fields) {
        put_field_value(out, field);
    }
    return out;
}

core::Result<core::EntityValue> EntityCodec::decode_value(const core::Bytes& data) {
    Reader reader(data);
    uint8_t magic;
    if (!reader.read_raw(magic) || magic != kValueMagic) {
        return core::Result<core::EntityValue>(corrupted("bad entity value magic", reader));
    }
    core::EntityValue value;
    if (!reader.read_bytes(value.entity_id)) {
        return core::Result<core::EntityValue>(corrupted("truncated entity id", reader));
    }
    if (!reader.read_raw(value.timestamp_nanoseconds)) {
        return core::Result<core::EntityValue>(corrupted("truncated timestamp", reader));
    }
    uint32_t field_count;
    if (!reader.read_count(field_count, 1)) {
        return core::Result<core::EntityValue>(corrupted("bad field count", reader));
    }
    value.fields.resize(field_count);
    for (auto& field : value.fields) {
        if (!reader.read_field_value(field)) {
            return core::Result<core::EntityValue>(corrupted("bad field value", reader));
        }
    }
    if (!reader.done()) {
        return core::Result<core::EntityValue>(corrupted("trailing bytes", reader));
    }
    return value;
}

core::Bytes EntityCodec::encode_entity(const core::Entity& entity) {
    core::Bytes out;
    out.push_back(kEntityMagic);
    put_bytes(out, entity.entity_id.data(), entity.entity_id.size());
    put_raw<uint64_t>(out, entity.timestamp_nanoseconds);
    uint8_t flags = 0;
    if (entity.fields) flags |= kHasFields;
    if (entity.data_binary) flags |= kHasDataBinary;
    out.push_back(flags);
    if (entity.fields) {
        put_raw<uint32_t>(out, static_cast<uint32_t>(entity.fields->size()));
        for (const auto& field : *entity.fields) {
            put_string(out, field.name);
            put_field_value(out, field.value);
        }
    }
    if (entity.data_binary) {
        put_bytes(out, entity.data_binary->data(), entity.data_binary->size());
    }
    return out;
}

core::Result<core::Entity> EntityCodec::decode_entity(const core::Bytes& data) {
    Reader reader(data);
    uint8_t magic;
    if (!reader.read_raw(magic) || magic != kEntityMagic) {
        return core::Result<core::Entity>(corrupted("bad entity magic", reader));
    }
    core::Entity entity;
    uint8_t flags;
    if (!reader.read_bytes(entity.entity_id) ||
        !reader.read_raw(entity.timestamp_nanoseconds) ||
        !reader.read_raw(flags)) {
        return core::Result<core::Entity>(corrupted("truncated entity header", reader));
    }
    if (flags & kHasFields) {
        uint32_t count;
        if (!reader.read_count(count, sizeof(uint32_t) + 1)) {
            return core::Result<core::Entity>(corrupted("bad field count", reader));
        }
        std::vector<core::Field> fields(count);
        for (auto& field : fields) {
            if (!reader.read_string(field.name) || !reader.read_field_value(field.value)) {
                return core::Result<core::Entity>(corrupted("bad field", reader));
            }
        }
        entity.fields = std::move(fields);
    }
    if (flags & kHasDataBinary) {
        core::Bytes payload;
        if (!reader.read_bytes(payload)) {
            return core::Result<core::Entity>(corrupted("truncated data binary", reader));
        }
        entity.data_binary = std::move(payload);
    }
    if (!reader.done()) {
        return core::Result<core::Entity>(corrupted("trailing bytes", reader));
    }
    return entity;
}

std::vector<core::Field> EntityCodec::transform(const core::EntityValue& value,
                                                const std::vector<core::FieldEntry>& entries) {
    std::vector<core::Field> fields;
    fields.reserve(entries.size());
    for (const auto& entry : entries) {
        core::Field field;
        field.name = entry.key;
        if (entry.index >= 0 && static_cast<size_t>(entry.index) < value.fields.size()) {
            field.value = value.fields[entry.index];
        }
        fields.push_back(std::move(field));
    }
    return fields;
}

} // namespace record
} // namespace tracedb
