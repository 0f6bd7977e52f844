/**
 * @file main.cpp
 * @brief hybridlink-inspect - DataPoint 프레임/값 점검 도구
 *
 * 사용법:
 *   hybridlink-inspect decode <text>
 *   hybridlink-inspect encode <id> <type> <value>
 *   hybridlink-inspect normalize <raw> <product> <capability>
 *   hybridlink-inspect profiles
 * 결과는 JSON 으로 stdout 에 출력한다.
 */

#include "Codec/CommandBuilder.h"
#include "Codec/FrameCodec.h"
#include "Codec/TypeCodec.h"
#include "Engine/HybridEngine.h"
#include "Logging/LogManager.h"
#include "Profile/ProductRules.h"
#include "Utils/ByteEncoding.h"
#include "Utils/ConfigManager.h"

#include <nlohmann/json.hpp>

#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

using json = nlohmann::json;
using namespace HybridLink;

namespace {

void PrintUsage(const char *program_name) {
  std::cerr << "사용법: " << program_name << " [옵션] <명령> [인자...]\n\n";
  std::cerr << "명령:\n";
  std::cerr << "  decode <text>                        프레임 디코딩 (raw/hex/base64/JSON)\n";
  std::cerr << "  encode <id> <type> <value>           DataPoint 프레임 인코딩\n";
  std::cerr << "  normalize <raw> <product> <cap>      제품 규칙으로 값 정규화\n";
  std::cerr << "  profiles                             등록된 프로필 목록\n\n";
  std::cerr << "옵션:\n";
  std::cerr << "  --help                               도움말 출력\n";
  std::cerr << "  --config=PATH                        설정 파일 추가 로드\n";
  std::cerr << "  --verbose                            로그를 콘솔에 출력\n\n";
  std::cerr << "type: raw, bool, value, string, enum, bitmap\n";
}

json SemanticToJson(const std::optional<BasicTypes::SemanticValue> &value) {
  if (!value)
    return nullptr;
  return std::visit([](auto &&arg) -> json { return arg; }, *value);
}

json DpValueToJson(const BasicTypes::DpValue &value) {
  return std::visit(
      [](auto &&arg) -> json {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, BasicTypes::ByteBuffer>) {
          return BasicTypes::BytesToHex(arg);
        } else if constexpr (std::is_same_v<T, BasicTypes::EnumValue>) {
          json j = {{"ordinal", arg.ordinal}};
          if (!arg.name.empty())
            j["name"] = arg.name;
          return j;
        } else {
          return arg;
        }
      },
      value);
}

// =============================================================================
// 명령들
// =============================================================================

int CmdDecode(const std::string &text) {
  BasicTypes::ByteBuffer bytes = Codec::FrameCodec::NormalizeInput(text);
  Codec::FrameReader reader(bytes);

  json records = json::array();
  for (const auto &record : reader) {
    json r = {{"id", record.id},
              {"type", Enums::DpTypeToString(record.type)},
              {"length", record.payload.size()},
              {"payload", BasicTypes::BytesToHex(record.payload)}};
    if (auto value = Codec::TypeCodec::Decode(record))
      r["value"] = DpValueToJson(*value);
    else
      r["value"] = nullptr;
    records.push_back(r);
  }

  json out = {{"bytes", Codec::FrameCodec::HexDump(bytes)},
              {"records", records},
              {"discardedBytes", reader.DiscardedBytes()},
              {"skippedRecords", reader.SkippedRecords()}};

  // envelope 로 해석 가능한 경우 함께 보여준다
  if (auto command = Codec::CommandBuilder::ParseCommand(bytes)) {
    if (!command->records.empty()) {
      out["command"] = {{"status", command->status},
                        {"transaction", command->transaction},
                        {"records", command->records.size()}};
    }
  }

  std::cout << out.dump(2) << std::endl;
  return 0;
}

int CmdEncode(const std::string &id_text, const std::string &type_text,
              const std::string &value_text) {
  int id = 0;
  try {
    id = std::stoi(id_text, nullptr, 0);
  } catch (const std::exception &e) {
    std::cerr << "잘못된 id: " << id_text << " (" << e.what() << ")\n";
    return 2;
  }
  if (id < 0 || id > 0xFF) {
    std::cerr << "id 범위 초과 (0-255): " << id << "\n";
    return 2;
  }

  Enums::DpType type;
  if (!Enums::StringToDpType(type_text, type)) {
    std::cerr << "알 수 없는 type: " << type_text << "\n";
    return 2;
  }

  auto value = Codec::TypeCodec::ParseValue(type, value_text);
  if (!value) {
    std::cerr << type_text << " 값으로 해석 불가: " << value_text << "\n";
    return 2;
  }

  auto frame = Codec::FrameCodec::Encode(static_cast<uint8_t>(id), type, *value);
  if (!frame) {
    std::cerr << "인코딩 실패\n";
    return 1;
  }

  json out = {{"id", id},
              {"type", Enums::DpTypeToString(type)},
              {"value", DpValueToJson(*value)},
              {"hex", Codec::FrameCodec::HexDump(*frame)},
              {"base64", Utils::Base64Encode(*frame)}};
  std::cout << out.dump(2) << std::endl;
  return 0;
}

int CmdNormalize(const std::string &raw_text, const std::string &product,
                 const std::string &capability) {
  double raw = 0.0;
  try {
    size_t consumed = 0;
    raw = std::stod(raw_text, &consumed);
    if (consumed != raw_text.size())
      throw std::invalid_argument("trailing characters");
  } catch (const std::exception &e) {
    std::cerr << "잘못된 raw 값: " << raw_text << " (" << e.what() << ")\n";
    return 2;
  }

  auto rule = Profile::ProductRules::Find(product, capability);
  if (!rule) {
    std::cerr << "규칙 없음: " << product << "/" << capability << "\n";
    return 1;
  }

  // 정수면 integer32 와 같은 모양으로 넘긴다
  BasicTypes::DpValue value;
  if (std::floor(raw) == raw && std::fabs(raw) < 9.0e15)
    value = BasicTypes::DpValue(std::in_place_index<2>,
                                static_cast<int64_t>(raw));
  else
    value = BasicTypes::DpValue(std::in_place_index<3>, raw_text);

  auto result = Engine::HybridEngine::Normalize(value, *rule);

  json out = {{"raw", raw},
              {"product", product},
              {"capability", capability},
              {"rule", rule->ToJson()},
              {"isValid", result.is_valid},
              {"correctedValue", SemanticToJson(result.corrected_value)},
              {"correctionKind",
               Enums::CorrectionKindToString(result.correction)}};
  if (result.applied_divisor)
    out["appliedDivisor"] = *result.applied_divisor;
  if (result.applied_multiplier)
    out["appliedMultiplier"] = *result.applied_multiplier;
  if (!result.message.empty())
    out["message"] = result.message;

  std::cout << out.dump(2) << std::endl;
  return result.is_valid ? 0 : 3;
}

int CmdProfiles() {
  Engine::HybridEngine engine(
      Engine::EngineSettings::FromConfig(ConfigManager::getInstance()));
  engine.LoadProfiles();

  json profiles = json::array();
  for (const auto &fp : engine.Registry().Fingerprints()) {
    auto profile = engine.ResolveProfile(fp);
    if (!profile)
      continue;
    json p = profile->ToJson();
    p["vendorId"] = fp.vendor_id;
    p["modelId"] = fp.model_id;
    profiles.push_back(p);
  }
  std::cout << json{{"profiles", profiles}}.dump(2) << std::endl;
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  try {
    std::vector<std::string> args;
    bool verbose = false;
    std::string config_path;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg == "--help" || arg == "-h") {
        PrintUsage(argv[0]);
        return 0;
      } else if (arg == "--verbose") {
        verbose = true;
      } else if (arg.rfind("--config=", 0) == 0) {
        config_path = arg.substr(9);
      } else {
        args.push_back(arg);
      }
    }

    // 설정 먼저, 그 다음 로그 설정 반영
    ConfigManager &config = ConfigManager::getInstance();
    if (!config_path.empty() && !config.load(config_path)) {
      std::cerr << "설정 파일 로드 실패: " << config_path << "\n";
      return 2;
    }
    LogManager::getInstance().reloadSettings();
    LogManager::getInstance().setConsoleOutput(verbose);
    if (verbose)
      LogManager::getInstance().setLogLevel(LogLevel::DEBUG);

    if (args.empty()) {
      PrintUsage(argv[0]);
      return 2;
    }

    const std::string &command = args[0];
    if (command == "decode" && args.size() == 2)
      return CmdDecode(args[1]);
    if (command == "encode" && args.size() == 4)
      return CmdEncode(args[1], args[2], args[3]);
    if (command == "normalize" && args.size() == 4)
      return CmdNormalize(args[1], args[2], args[3]);
    if (command == "profiles" && args.size() == 1)
      return CmdProfiles();

    PrintUsage(argv[0]);
    return 2;

  } catch (const std::exception &e) {
    std::cerr << "오류: " << e.what() << std::endl;
    return 1;
  }
}
