#include "easchema/AbiCodec.hpp"

#include "easchema/ErrorReporter.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include <algorithm>
#include <cassert>
#include <unordered_map>
#include <utility>

namespace {

bool isValidUTF8(const uint8_t* data, size_t size) {
    size_t i = 0;
    while (i < size) {
        uint8_t lead = data[i];
        size_t continuation = 0;
        uint32_t codePoint = 0;
        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xe0) == 0xc0) {
            continuation = 1;
            codePoint = lead & 0x1f;
        } else if ((lead & 0xf0) == 0xe0) {
            continuation = 2;
            codePoint = lead & 0x0f;
        } else if ((lead & 0xf8) == 0xf0) {
            continuation = 3;
            codePoint = lead & 0x07;
        } else {
            return false;
        }
        if (size - i <= continuation) {
            return false;
        }
        for (size_t j = 1; j <= continuation; ++j) {
            uint8_t next = data[i + j];
            if ((next & 0xc0) != 0x80) {
                return false;
            }
            codePoint = (codePoint << 6) | (next & 0x3f);
        }
        // Reject overlong forms, UTF-16 surrogates and values past the last code point.
        static const uint32_t kMinimum[] = { 0, 0x80, 0x800, 0x10000 };
        if (codePoint < kMinimum[continuation] || (codePoint >= 0xd800 && codePoint <= 0xdfff)
                || codePoint > 0x10ffff) {
            return false;
        }
        i += continuation + 1;
    }
    return true;
}

void appendWord(const easchema::Word& word, easchema::Bytes& data) {
    data.insert(data.end(), word.begin(), word.end());
}

} // namespace

namespace easchema {

// The types of a head/tail encoded sequence, either the members of a tuple or count repetitions of an array element.
struct AbiCodec::Sequence {
    Sequence(const std::vector<ParamType>& m): members(&m), element(nullptr), count(m.size()) {}
    Sequence(const ParamType& e, size_t c): members(nullptr), element(&e), count(c) {}

    const ParamType& at(size_t i) const { return members ? (*members)[i] : *element; }

    const std::vector<ParamType>* members;
    const ParamType* element;
    size_t count;
};

AbiCodec::AbiCodec(std::shared_ptr<ErrorReporter> errorReporter): m_errorReporter(errorReporter) {}

bool AbiCodec::encode(const std::vector<ParamType>& types, const std::vector<Value>& values, Bytes& data) const {
    data.clear();
    if (types.size() != values.size()) {
        return fail(fmt::format("types/values length mismatch: {} types, {} values", types.size(), values.size()));
    }

    std::vector<const Value*> valuePointers;
    valuePointers.reserve(values.size());
    for (const auto& value : values) {
        valuePointers.emplace_back(&value);
    }

    if (!encodeSequence(Sequence(types), valuePointers, data)) {
        data.clear();
        return false;
    }
    SPDLOG_DEBUG("Encoded {} values into {} bytes", values.size(), data.size());
    return true;
}

bool AbiCodec::decode(const std::vector<ParamType>& types, const Bytes& data, std::vector<Value>& values) const {
    values.clear();
    if (!decodeSequence(Sequence(types), data, 0, values)) {
        values.clear();
        return false;
    }
    SPDLOG_DEBUG("Decoded {} values from {} bytes", values.size(), data.size());
    return true;
}

// static
Value AbiCodec::defaultValue(const ParamType& type) {
    static const std::unordered_map<ParamType::Kind, Value> kDefaults = {
        { ParamType::kBool, Value::makeBool(false) },
        { ParamType::kUint, Value::makeString("0") },
        { ParamType::kAddress, Value::makeString(kZeroAddress) },
        { ParamType::kArray, Value::makeList({}) }
    };
    auto iter = kDefaults.find(type.kind);
    if (iter != kDefaults.end()) {
        return iter->second;
    }
    return Value::makeString("");
}

// static
Bytes AbiCodec::formatBytes32String(std::string_view text) {
    Bytes bytes(kWordSize, 0);
    std::copy_n(text.begin(), std::min(text.size(), kWordSize - 1), bytes.begin());
    return bytes;
}

// static
bool AbiCodec::isBytesLike(const Value& value) {
    if (value.kind() == Value::kBytes) {
        return true;
    }
    return value.kind() == Value::kString && easchema::isBytesLike(value.asText());
}

bool AbiCodec::encodeSequence(const Sequence& sequence, const std::vector<const Value*>& values, Bytes& data) const {
    assert(sequence.count == values.size());

    size_t headSize = 0;
    for (size_t i = 0; i < sequence.count; ++i) {
        headSize += sequence.at(i).headSize();
    }

    Bytes head;
    Bytes tail;
    for (size_t i = 0; i < sequence.count; ++i) {
        const ParamType& type = sequence.at(i);
        if (type.isDynamic()) {
            appendWord(sizeToWord(headSize + tail.size()), head);
            if (!encodeValue(type, *values[i], tail)) {
                return false;
            }
        } else if (!encodeValue(type, *values[i], head)) {
            return false;
        }
    }

    assert(head.size() == headSize);
    data.insert(data.end(), head.begin(), head.end());
    data.insert(data.end(), tail.begin(), tail.end());
    return true;
}

bool AbiCodec::encodeValue(const ParamType& type, const Value& value, Bytes& data) const {
    switch (type.kind) {
    case ParamType::kTuple:
        return encodeTuple(type, value, data);

    case ParamType::kArray:
        return encodeArray(type, value, data);

    case ParamType::kString:
    case ParamType::kBytes:
        return encodeDynamicBytes(type, value, data);

    case ParamType::kAddress:
    case ParamType::kBool:
    case ParamType::kFixedBytes:
    case ParamType::kUint:
    case ParamType::kInt: {
        Word word;
        if (!encodeElementary(type, value, word)) {
            return false;
        }
        appendWord(word, data);
        return true;
    }
    }
    return fail(fmt::format("unknown type kind {}", static_cast<int>(type.kind)));
}

bool AbiCodec::encodeTuple(const ParamType& type, const Value& value, Bytes& data) const {
    std::vector<const Value*> members;
    members.reserve(type.components.size());

    if (value.kind() == Value::kList) {
        if (value.asList().size() != type.components.size()) {
            return fail(fmt::format("tuple {} expects {} components, got {}", type.canonical(),
                type.components.size(), value.asList().size()));
        }
        for (const auto& member : value.asList()) {
            members.emplace_back(&member);
        }
    } else if (value.kind() == Value::kObject) {
        for (const auto& component : type.components) {
            if (component.name.empty()) {
                return fail(fmt::format("tuple {} has unnamed components and cannot be encoded from an object",
                    type.canonical()));
            }
            const Value* member = value.member(component.name);
            if (member == nullptr) {
                return fail(fmt::format("missing tuple component '{}' for {}", component.name, type.canonical()));
            }
            members.emplace_back(member);
        }
    } else {
        return fail(fmt::format("expected a list or object for tuple {}, got {}", type.canonical(),
            value.toString()));
    }

    return encodeSequence(Sequence(type.components), members, data);
}

bool AbiCodec::encodeArray(const ParamType& type, const Value& value, Bytes& data) const {
    if (value.kind() != Value::kList) {
        return fail(fmt::format("expected a list for {}, got {}", type.canonical(), value.toString()));
    }

    const auto& elements = value.asList();
    if (type.size == ParamType::kDynamicLength) {
        appendWord(sizeToWord(elements.size()), data);
    } else if (elements.size() != static_cast<size_t>(type.size)) {
        return fail(fmt::format("array {} expects {} elements, got {}", type.canonical(), type.size,
            elements.size()));
    }

    std::vector<const Value*> elementPointers;
    elementPointers.reserve(elements.size());
    for (const auto& element : elements) {
        elementPointers.emplace_back(&element);
    }
    return encodeSequence(Sequence(type.element(), elements.size()), elementPointers, data);
}

bool AbiCodec::encodeElementary(const ParamType& type, const Value& value, Word& word) const {
    word.fill(0);
    switch (type.kind) {
    case ParamType::kAddress: {
        Bytes address;
        if (value.kind() == Value::kBytes) {
            address = value.asBytes();
        } else if (value.kind() != Value::kString || !fromHex(value.asText(), address)) {
            return fail(fmt::format("invalid address {}", value.toString()));
        }
        if (address.size() != kAddressSize) {
            return fail(fmt::format("invalid address {}", value.toString()));
        }
        std::copy(address.begin(), address.end(), word.begin() + (kWordSize - kAddressSize));
        return true;
    }

    case ParamType::kBool:
        if (value.kind() != Value::kBool) {
            return fail(fmt::format("expected a bool, got {}", value.toString()));
        }
        word[kWordSize - 1] = value.asBool() ? 1 : 0;
        return true;

    case ParamType::kUint:
    case ParamType::kInt: {
        if (value.kind() != Value::kInteger && value.kind() != Value::kString) {
            return fail(fmt::format("expected an integer for {}, got {}", type.canonical(), value.toString()));
        }
        std::string error;
        if (!encodeInteger(value.asText(), type.size, type.kind == ParamType::kInt, word, error)) {
            return fail(error);
        }
        return true;
    }

    case ParamType::kFixedBytes: {
        Bytes bytes;
        if (value.kind() == Value::kBytes) {
            bytes = value.asBytes();
        } else if (value.kind() != Value::kString || !fromHex(value.asText(), bytes)) {
            return fail(fmt::format("invalid {} value {}", type.canonical(), value.toString()));
        }
        if (bytes.size() != static_cast<size_t>(type.size)) {
            return fail(fmt::format("incorrect data length for {}: got {} bytes", type.canonical(), bytes.size()));
        }
        std::copy(bytes.begin(), bytes.end(), word.begin());
        return true;
    }

    default:
        assert(false);
        return fail(fmt::format("{} is not an elementary type", type.canonical()));
    }
}

bool AbiCodec::encodeDynamicBytes(const ParamType& type, const Value& value, Bytes& data) const {
    Bytes payload;
    if (type.kind == ParamType::kString) {
        if (value.kind() != Value::kString) {
            return fail(fmt::format("expected a string, got {}", value.toString()));
        }
        payload.assign(value.asText().begin(), value.asText().end());
    } else if (value.kind() == Value::kBytes) {
        payload = value.asBytes();
    } else if (value.kind() != Value::kString || !fromHex(value.asText(), payload)) {
        return fail(fmt::format("invalid bytes value {}", value.toString()));
    }

    appendWord(sizeToWord(payload.size()), data);
    data.insert(data.end(), payload.begin(), payload.end());
    size_t padding = (kWordSize - (payload.size() % kWordSize)) % kWordSize;
    data.insert(data.end(), padding, 0);
    return true;
}

bool AbiCodec::decodeSequence(const Sequence& sequence, const Bytes& data, size_t start,
        std::vector<Value>& values) const {
    size_t position = start;
    for (size_t i = 0; i < sequence.count; ++i) {
        const ParamType& type = sequence.at(i);
        Value value;
        if (type.isDynamic()) {
            Word word;
            if (!readWord(data, position, word)) {
                return false;
            }
            size_t offset = 0;
            if (!wordToSize(word, offset) || start + offset > data.size()) {
                return fail(fmt::format("offset of {} at byte {} points past the end of the data", type.canonical(),
                    position));
            }
            if (!decodeValue(type, data, start + offset, value)) {
                return false;
            }
            position += kWordSize;
        } else {
            if (!decodeValue(type, data, position, value)) {
                return false;
            }
            position += type.headSize();
        }
        values.emplace_back(std::move(value));
    }
    return true;
}

bool AbiCodec::decodeValue(const ParamType& type, const Bytes& data, size_t position, Value& value) const {
    switch (type.kind) {
    case ParamType::kTuple: {
        std::vector<Value> members;
        if (!decodeSequence(Sequence(type.components), data, position, members)) {
            return false;
        }
        value = Value::makeList(std::move(members));
        return true;
    }

    case ParamType::kArray: {
        size_t count = 0;
        size_t start = position;
        if (type.size == ParamType::kDynamicLength) {
            Word word;
            if (!readWord(data, position, word)) {
                return false;
            }
            if (!wordToSize(word, count)) {
                return fail(fmt::format("array length of {} at byte {} is too large", type.canonical(), position));
            }
            start = position + kWordSize;
        } else {
            count = static_cast<size_t>(type.size);
        }
        // Every element occupies at least one word of head, so a count beyond that is not backed by data.
        if (start > data.size() || count > (data.size() - start) / kWordSize) {
            return fail(fmt::format("insufficient data for {} elements of {} at byte {}", count, type.canonical(),
                position));
        }
        std::vector<Value> elements;
        elements.reserve(count);
        if (!decodeSequence(Sequence(type.element(), count), data, start, elements)) {
            return false;
        }
        value = Value::makeList(std::move(elements));
        return true;
    }

    case ParamType::kString:
    case ParamType::kBytes:
        return decodeDynamicBytes(type, data, position, value);

    case ParamType::kAddress:
    case ParamType::kBool:
    case ParamType::kFixedBytes:
    case ParamType::kUint:
    case ParamType::kInt: {
        Word word;
        if (!readWord(data, position, word)) {
            return false;
        }
        return decodeElementary(type, word, value);
    }
    }
    return fail(fmt::format("unknown type kind {}", static_cast<int>(type.kind)));
}

bool AbiCodec::decodeElementary(const ParamType& type, const Word& word, Value& value) const {
    switch (type.kind) {
    case ParamType::kAddress: {
        const size_t padding = kWordSize - kAddressSize;
        if (std::any_of(word.begin(), word.begin() + padding, [](uint8_t b) { return b != 0; })) {
            return fail(fmt::format("address value {} out of range", toHex(word.data(), word.size())));
        }
        value = Value::makeString(toHex(word.data() + padding, kAddressSize));
        return true;
    }

    case ParamType::kBool:
        value = Value::makeBool(std::any_of(word.begin(), word.end(), [](uint8_t b) { return b != 0; }));
        return true;

    case ParamType::kUint:
    case ParamType::kInt:
        value = Value::makeInteger(decodeInteger(word, type.size, type.kind == ParamType::kInt));
        return true;

    case ParamType::kFixedBytes:
        value = Value::makeBytes(Bytes(word.begin(), word.begin() + type.size));
        return true;

    default:
        assert(false);
        return fail(fmt::format("{} is not an elementary type", type.canonical()));
    }
}

bool AbiCodec::decodeDynamicBytes(const ParamType& type, const Bytes& data, size_t position, Value& value) const {
    Word word;
    if (!readWord(data, position, word)) {
        return false;
    }
    size_t length = 0;
    size_t start = position + kWordSize;
    if (!wordToSize(word, length) || length > data.size() - start) {
        return fail(fmt::format("insufficient data for {} at byte {}", type.canonical(), position));
    }

    const uint8_t* payload = data.data() + start;
    if (type.kind == ParamType::kString) {
        if (!isValidUTF8(payload, length)) {
            return fail(fmt::format("invalid UTF-8 in string at byte {}", position));
        }
        value = Value::makeString(std::string(reinterpret_cast<const char*>(payload), length));
    } else {
        value = Value::makeBytes(Bytes(payload, payload + length));
    }
    return true;
}

bool AbiCodec::readWord(const Bytes& data, size_t position, Word& word) const {
    if (position > data.size() || data.size() - position < kWordSize) {
        return fail(fmt::format("data out-of-bounds reading word at byte {} of {}", position, data.size()));
    }
    std::copy_n(data.begin() + position, kWordSize, word.begin());
    return true;
}

bool AbiCodec::fail(const std::string& message) const {
    m_errorReporter->addError(ErrorReporter::kCodec, message);
    return false;
}

} // namespace easchema
