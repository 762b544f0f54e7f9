#pragma once

#ifndef CHAUMAUTH_WIRE_MESSAGES_HPP
#define CHAUMAUTH_WIRE_MESSAGES_HPP

#include <concepts>  // for same_as
#include <cstdint>   // for uint8_t
#include <expected>  // for expected
#include <span>      // for span
#include <string>    // for string
#include <vector>    // for vector

#include <flatbuffers/flatbuffer_builder.h>  // for FlatBufferBuilder

namespace chaumauth::wire {
struct RegisterRequest;
struct RegisterResponse;
struct ChallengeRequest;
struct ChallengeResponse;
struct AnswerRequest;
struct AnswerResponse;
}  // namespace chaumauth::wire

namespace chaumauth {

template <typename MessageType>
concept WireMessage = std::same_as<MessageType, wire::RegisterRequest> or
                      std::same_as<MessageType, wire::RegisterResponse> or
                      std::same_as<MessageType, wire::ChallengeRequest> or
                      std::same_as<MessageType, wire::ChallengeResponse> or
                      std::same_as<MessageType, wire::AnswerRequest> or
                      std::same_as<MessageType, wire::AnswerResponse>;

// Verifies buffer against the schema of MessageType (offsets, bounds and
// required fields) before handing out the root table. The returned pointer
// aliases buffer.
template <chaumauth::WireMessage MessageType>
[[nodiscard]] auto flatbuffer_to_struct(std::span<uint8_t const> buffer)
    -> std::expected<MessageType const *, std::string>;

// JSON rendering of a message, for diagnostics. The schema file is read from
// disk on every call.
template <chaumauth::WireMessage MessageType>
[[nodiscard]] auto flatbuffer_to_json(
    std::span<uint8_t const> buffer, std::string const &schema_file_name,
    std::vector<std::string> const &include_dirs = {})
    -> std::expected<std::string, std::string>;

[[nodiscard]]
auto flatbuffer_bytes(flatbuffers::FlatBufferBuilder const &builder)
    -> std::vector<uint8_t>;

struct RegisterParams {
  std::string user;
  std::vector<uint8_t> y1;
  std::vector<uint8_t> y2;
};

struct ChallengeParams {
  std::string user;
  std::vector<uint8_t> r1;
  std::vector<uint8_t> r2;
};

struct AnswerParams {
  std::string auth_id;
  std::vector<uint8_t> s;
};

[[nodiscard]]
auto flatbuffer_build_register_request(RegisterParams const &params)
    -> flatbuffers::FlatBufferBuilder;

[[nodiscard]]
auto flatbuffer_build_register_response() -> flatbuffers::FlatBufferBuilder;

[[nodiscard]]
auto flatbuffer_build_challenge_request(ChallengeParams const &params)
    -> flatbuffers::FlatBufferBuilder;

[[nodiscard]]
auto flatbuffer_build_challenge_response(std::string const &auth_id,
                                         std::vector<uint8_t> const &challenge)
    -> flatbuffers::FlatBufferBuilder;

[[nodiscard]]
auto flatbuffer_build_answer_request(AnswerParams const &params)
    -> flatbuffers::FlatBufferBuilder;

[[nodiscard]]
auto flatbuffer_build_answer_response(std::string const &session_id)
    -> flatbuffers::FlatBufferBuilder;

}  // namespace chaumauth

#endif /* CHAUMAUTH_WIRE_MESSAGES_HPP */
