// Implementation of signature parsing and key names.

#include "score/signature.h"

#include <cctype>

namespace engrave {

namespace {

/// Natural tonics by quarter-step position above C.
struct NaturalTonic {
  int position;
  char letter;
};

constexpr NaturalTonic kNaturals[] = {
    {0, 'C'}, {4, 'D'}, {8, 'E'}, {10, 'F'}, {14, 'G'}, {18, 'A'}, {22, 'B'}, {24, 'C'},
};

constexpr const char* kSharpSuffix[] = {"", "t", "#", "t#"};
constexpr const char* kFlatSuffix[] = {"", "d", "b", "db"};

bool parseDecimal(std::string_view text, int& out) {
  if (text.empty() || text.size() > 6) return false;
  int value = 0;
  for (char chr : text) {
    if (!std::isdigit(static_cast<unsigned char>(chr))) return false;
    value = value * 10 + (chr - '0');
  }
  out = value;
  return true;
}

}  // namespace

// ---------------------------------------------------------------------------
// TimeSignature
// ---------------------------------------------------------------------------

bool TimeSignature::isValid() const {
  if (beats <= 0 || beat_unit <= 0 || beat_unit > kMaxBeatUnit) return false;
  return (beat_unit & (beat_unit - 1)) == 0;
}

std::string TimeSignature::toString() const {
  return std::to_string(beats) + "/" + std::to_string(beat_unit);
}

std::optional<TimeSignature> parseTimeSignature(std::string_view text) {
  size_t slash = text.find('/');
  if (slash == std::string_view::npos) return std::nullopt;
  TimeSignature time;
  if (!parseDecimal(text.substr(0, slash), time.beats)) return std::nullopt;
  if (!parseDecimal(text.substr(slash + 1), time.beat_unit)) return std::nullopt;
  return time;
}

// ---------------------------------------------------------------------------
// KeySignature
// ---------------------------------------------------------------------------

bool KeySignature::isValid() const {
  return key >= -kMaxKeyIndex && key <= kMaxKeyIndex && tempo > 0 && swing >= 0 &&
         swing <= 100;
}

std::string keyName(int key) {
  if (key < -kMaxKeyIndex || key > kMaxKeyIndex) return "";

  if (key >= 0) {
    // Highest natural at or below the position, raised.
    const NaturalTonic* base = &kNaturals[0];
    for (const auto& natural : kNaturals) {
      if (natural.position <= key) base = &natural;
    }
    return std::string(1, base->letter) + kSharpSuffix[key - base->position];
  }

  // Lowest natural at or above the position, lowered.
  int position = 24 + key;
  for (const auto& natural : kNaturals) {
    if (natural.position >= position) {
      return std::string(1, natural.letter) + kFlatSuffix[natural.position - position];
    }
  }
  return "";
}

// ---------------------------------------------------------------------------
// Signature records
// ---------------------------------------------------------------------------

SignatureParseResult signatureFromJson(const JsonObject& object) {
  SignatureParseResult result;

  const JsonValue* time = findJsonValue(object, "time", JsonValue::String);
  if (time == nullptr) {
    result.error = "time";
    return result;
  }
  auto parsed = parseTimeSignature(time->string_val);
  if (!parsed) {
    result.error = "time";
    return result;
  }
  result.signature.time = *parsed;

  struct IntField {
    const char* name;
    int* target;
  };
  const IntField fields[] = {
      {"key", &result.signature.key.key},
      {"tempo", &result.signature.key.tempo},
      {"swing", &result.signature.key.swing},
  };
  for (const auto& field : fields) {
    auto iter = object.find(field.name);
    if (iter == object.end()) continue;
    if (!iter->second.isInteger()) {
      result.error = field.name;
      return result;
    }
    *field.target = iter->second.asInt();
  }

  auto micro = object.find("microtonal");
  if (micro != object.end()) {
    if (micro->second.type != JsonValue::Bool) {
      result.error = "microtonal";
      return result;
    }
    result.signature.key.microtonal = micro->second.bool_val;
  }

  result.success = true;
  return result;
}

SignatureParseResult signatureFromJson(std::string_view json) {
  JsonParseResult parsed = parseJsonObject(json);
  if (!parsed.success) {
    SignatureParseResult result;
    result.error = "malformed JSON at offset " + std::to_string(parsed.error_offset);
    return result;
  }
  return signatureFromJson(parsed.values);
}

}  // namespace engrave
