#include "chaumauth/wire_messages.hpp"

#include <flatbuffers/idl.h>       // for Parser, GenerateText
#include <flatbuffers/util.h>      // for LoadFile
#include <flatbuffers/verifier.h>  // for Verifier

#include <format>       // for format
#include <ranges>       // for views::transform, ranges::to
#include <string_view>  // for string_view
#include <utility>      // for move

#include "chaumauth/macro_tools.hpp"                // for UNEXPECTED_IF
#include "flatbuffers/auth_messages_generated.h"  // for RegisterRequest...

namespace chaumauth {

namespace {

// Fully qualified table names, as the schema parser knows them.
template <chaumauth::WireMessage MessageType>
struct [[nodiscard]] message_name_impl;

// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define DECLARE_MESSAGE_NAME(Type)                              \
  template <>                                                   \
  struct [[nodiscard]] message_name_impl<wire::Type> {          \
    static constexpr std::string_view _{"chaumauth.wire." #Type}; \
  };

DECLARE_MESSAGE_NAME(RegisterRequest)
DECLARE_MESSAGE_NAME(RegisterResponse)
DECLARE_MESSAGE_NAME(ChallengeRequest)
DECLARE_MESSAGE_NAME(ChallengeResponse)
DECLARE_MESSAGE_NAME(AnswerRequest)
DECLARE_MESSAGE_NAME(AnswerResponse)
#undef DECLARE_MESSAGE_NAME

template <chaumauth::WireMessage MessageType>
[[nodiscard]] auto verify_buffer(std::span<uint8_t const> const buffer) noexcept
    -> bool {
  if (buffer.data() == nullptr or buffer.empty()) {
    return false;
  }
  flatbuffers::Verifier verifier(buffer.data(), buffer.size());
  return verifier.VerifyBuffer<MessageType>(nullptr);
}

}  // namespace

template <chaumauth::WireMessage MessageType>
[[nodiscard]] auto flatbuffer_to_struct(std::span<uint8_t const> const buffer)
    -> std::expected<MessageType const *, std::string> {
  UNEXPECTED_IF(not verify_buffer<MessageType>(buffer),
                std::format("{} buffer verification failed",
                            message_name_impl<MessageType>::_))

  return flatbuffers::GetRoot<MessageType>(buffer.data());
}

// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define INSTANTIATE_FLATBUFFER_TO_STRUCT(Type)                          \
  template auto flatbuffer_to_struct<wire::Type>(std::span<uint8_t const>) \
      -> std::expected<wire::Type const *, std::string>;

INSTANTIATE_FLATBUFFER_TO_STRUCT(RegisterRequest)
INSTANTIATE_FLATBUFFER_TO_STRUCT(RegisterResponse)
INSTANTIATE_FLATBUFFER_TO_STRUCT(ChallengeRequest)
INSTANTIATE_FLATBUFFER_TO_STRUCT(ChallengeResponse)
INSTANTIATE_FLATBUFFER_TO_STRUCT(AnswerRequest)
INSTANTIATE_FLATBUFFER_TO_STRUCT(AnswerResponse)
#undef INSTANTIATE_FLATBUFFER_TO_STRUCT

template <chaumauth::WireMessage MessageType>
[[nodiscard]] auto flatbuffer_to_json(
    std::span<uint8_t const> const buffer, std::string const &schema_file_name,
    std::vector<std::string> const &include_dirs)
    -> std::expected<std::string, std::string> {
  std::string schema_file;

  UNEXPECTED_IF(
      not flatbuffers::LoadFile(schema_file_name.c_str(), false, &schema_file),
      std::format("Failed to load schema file {}", schema_file_name))

  flatbuffers::Parser parser;
  parser.opts.indent_step = 2;

  auto c_include_dirs = include_dirs |
                        std::views::transform([](auto const &data) -> auto {
                          return data.c_str();
                        }) |
                        std::ranges::to<std::vector>();
  c_include_dirs.push_back(nullptr);

  UNEXPECTED_IF(not parser.Parse(schema_file.c_str(), c_include_dirs.data()),
                std::format("Schema parse failed: {}", parser.error_))

  auto const root_name = std::string{message_name_impl<MessageType>::_};
  UNEXPECTED_IF(not parser.SetRootType(root_name.c_str()),
                std::format("{} not defined in {}", root_name, schema_file_name))

  UNEXPECTED_IF(not verify_buffer<MessageType>(buffer),
                "buffer verification failed")

  std::string json;
  auto const *const err =
      flatbuffers::GenerateText(parser, buffer.data(), &json);

  UNEXPECTED_IF(err not_eq nullptr,
                std::format("Failed to generate JSON {}", err))

  return json;
}

// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define INSTANTIATE_FLATBUFFER_TO_JSON(Type)                              \
  template auto flatbuffer_to_json<wire::Type>(                           \
      std::span<uint8_t const>, std::string const &,                      \
      std::vector<std::string> const &)                                   \
      -> std::expected<std::string, std::string>;

INSTANTIATE_FLATBUFFER_TO_JSON(RegisterRequest)
INSTANTIATE_FLATBUFFER_TO_JSON(RegisterResponse)
INSTANTIATE_FLATBUFFER_TO_JSON(ChallengeRequest)
INSTANTIATE_FLATBUFFER_TO_JSON(ChallengeResponse)
INSTANTIATE_FLATBUFFER_TO_JSON(AnswerRequest)
INSTANTIATE_FLATBUFFER_TO_JSON(AnswerResponse)
#undef INSTANTIATE_FLATBUFFER_TO_JSON

[[nodiscard]]
auto flatbuffer_bytes(flatbuffers::FlatBufferBuilder const &builder)
    -> std::vector<uint8_t> {
  auto const *const data = builder.GetBufferPointer();
  return {data, data + builder.GetSize()};
}

[[nodiscard]]
auto flatbuffer_build_register_request(RegisterParams const &params)
    -> flatbuffers::FlatBufferBuilder {
  flatbuffers::FlatBufferBuilder builder;

  auto const user_str = builder.CreateString(params.user);
  auto const y1_vec = builder.CreateVector(params.y1);
  auto const y2_vec = builder.CreateVector(params.y2);

  builder.Finish(wire::CreateRegisterRequest(builder, user_str, y1_vec, y2_vec));
  return builder;
}

[[nodiscard]]
auto flatbuffer_build_register_response() -> flatbuffers::FlatBufferBuilder {
  flatbuffers::FlatBufferBuilder builder;
  builder.Finish(wire::CreateRegisterResponse(builder));
  return builder;
}

[[nodiscard]]
auto flatbuffer_build_challenge_request(ChallengeParams const &params)
    -> flatbuffers::FlatBufferBuilder {
  flatbuffers::FlatBufferBuilder builder;

  auto const user_str = builder.CreateString(params.user);
  auto const r1_vec = builder.CreateVector(params.r1);
  auto const r2_vec = builder.CreateVector(params.r2);

  builder.Finish(
      wire::CreateChallengeRequest(builder, user_str, r1_vec, r2_vec));
  return builder;
}

[[nodiscard]]
auto flatbuffer_build_challenge_response(std::string const &auth_id,
                                         std::vector<uint8_t> const &challenge)
    -> flatbuffers::FlatBufferBuilder {
  flatbuffers::FlatBufferBuilder builder;

  auto const auth_id_str = builder.CreateString(auth_id);
  auto const c_vec = builder.CreateVector(challenge);

  builder.Finish(wire::CreateChallengeResponse(builder, auth_id_str, c_vec));
  return builder;
}

[[nodiscard]]
auto flatbuffer_build_answer_request(AnswerParams const &params)
    -> flatbuffers::FlatBufferBuilder {
  flatbuffers::FlatBufferBuilder builder;

  auto const auth_id_str = builder.CreateString(params.auth_id);
  auto const s_vec = builder.CreateVector(params.s);

  builder.Finish(wire::CreateAnswerRequest(builder, auth_id_str, s_vec));
  return builder;
}

[[nodiscard]]
auto flatbuffer_build_answer_response(std::string const &session_id)
    -> flatbuffers::FlatBufferBuilder {
  flatbuffers::FlatBufferBuilder builder;
  builder.Finish(
      wire::CreateAnswerResponse(builder, builder.CreateString(session_id)));
  return builder;
}

}  // namespace chaumauth
