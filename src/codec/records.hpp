#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "codec/borsh.hpp"

namespace x1memo::codec {

// Field ceilings enforced by the on-chain programs (byte lengths).
constexpr std::size_t kMaxUsernameLength = 32;
constexpr std::size_t kMaxProfileImageLength = 256;
constexpr std::size_t kMaxAboutMeLength = 128;
constexpr std::size_t kMaxNameLength = 64;
constexpr std::size_t kMaxDescriptionLength = 256;
constexpr std::size_t kMaxImageLength = 256;
constexpr std::size_t kMaxWebsiteLength = 128;
constexpr std::size_t kMaxTags = 4;
constexpr std::size_t kMaxTagLength = 32;
constexpr std::size_t kMaxBurnMessageLength = 696;
constexpr std::size_t kMaxPostTitleLength = 128;
constexpr std::size_t kMaxPostContentLength = 512;
constexpr std::size_t kMaxReplyLength = 512;
constexpr std::size_t kMaxChatMessageLength = 512;

constexpr std::uint8_t kRecordVersion = 1;

// Leading fields shared by every memo payload record.
struct RecordHeader {
  std::uint8_t version{kRecordVersion};
  std::string category;
  std::string operation;

  bool operator==(const RecordHeader& other) const = default;
};

struct ProfileCreationData {
  static constexpr std::string_view kCategory = "profile";
  static constexpr std::string_view kOperation = "create_profile";

  RecordHeader header{kRecordVersion, std::string(kCategory), std::string(kOperation)};
  std::string user_pubkey;
  std::string username;
  std::string image;
  std::optional<std::string> about_me;

  bool Validate(std::string* error) const;
  void Write(std::vector<std::uint8_t>* out) const;
  bool Read(BorshReader* reader);

  bool operator==(const ProfileCreationData& other) const = default;
};

struct ProfileUpdateData {
  static constexpr std::string_view kCategory = "profile";
  static constexpr std::string_view kOperation = "update_profile";

  RecordHeader header{kRecordVersion, std::string(kCategory), std::string(kOperation)};
  std::string user_pubkey;
  std::optional<std::string> username;
  std::optional<std::string> image;
  std::optional<std::optional<std::string>> about_me;

  bool Validate(std::string* error) const;
  void Write(std::vector<std::uint8_t>* out) const;
  bool Read(BorshReader* reader);

  bool operator==(const ProfileUpdateData& other) const = default;
};

struct BlogCreationData {
  static constexpr std::string_view kCategory = "blog";
  static constexpr std::string_view kOperation = "create_blog";

  RecordHeader header{kRecordVersion, std::string(kCategory), std::string(kOperation)};
  std::uint64_t blog_id{0};
  std::string name;
  std::string description;
  std::string image;

  bool Validate(std::string* error) const;
  void Write(std::vector<std::uint8_t>* out) const;
  bool Read(BorshReader* reader);

  bool operator==(const BlogCreationData& other) const = default;
};

struct BlogUpdateData {
  static constexpr std::string_view kCategory = "blog";
  static constexpr std::string_view kOperation = "update_blog";

  RecordHeader header{kRecordVersion, std::string(kCategory), std::string(kOperation)};
  std::uint64_t blog_id{0};
  std::optional<std::string> name;
  std::optional<std::string> description;
  std::optional<std::string> image;

  bool Validate(std::string* error) const;
  void Write(std::vector<std::uint8_t>* out) const;
  bool Read(BorshReader* reader);

  bool operator==(const BlogUpdateData& other) const = default;
};

struct BlogBurnData {
  static constexpr std::string_view kCategory = "blog";
  static constexpr std::string_view kOperation = "burn_for_blog";

  RecordHeader header{kRecordVersion, std::string(kCategory), std::string(kOperation)};
  std::uint64_t blog_id{0};
  std::string burner;
  std::string message;

  bool Validate(std::string* error) const;
  void Write(std::vector<std::uint8_t>* out) const;
  bool Read(BorshReader* reader);

  bool operator==(const BlogBurnData& other) const = default;
};

struct BlogMintData {
  static constexpr std::string_view kCategory = "blog";
  static constexpr std::string_view kOperation = "mint_for_blog";

  RecordHeader header{kRecordVersion, std::string(kCategory), std::string(kOperation)};
  std::uint64_t blog_id{0};
  std::string minter;
  std::string message;

  bool Validate(std::string* error) const;
  void Write(std::vector<std::uint8_t>* out) const;
  bool Read(BorshReader* reader);

  bool operator==(const BlogMintData& other) const = default;
};

struct PostCreationData {
  static constexpr std::string_view kCategory = "forum";
  static constexpr std::string_view kOperation = "create_post";

  RecordHeader header{kRecordVersion, std::string(kCategory), std::string(kOperation)};
  std::string creator;
  std::uint64_t post_id{0};
  std::string title;
  std::string content;
  std::string image;

  bool Validate(std::string* error) const;
  void Write(std::vector<std::uint8_t>* out) const;
  bool Read(BorshReader* reader);

  bool operator==(const PostCreationData& other) const = default;
};

struct PostBurnData {
  static constexpr std::string_view kCategory = "forum";
  static constexpr std::string_view kOperation = "burn_for_post";

  RecordHeader header{kRecordVersion, std::string(kCategory), std::string(kOperation)};
  std::string user;
  std::uint64_t post_id{0};
  std::string message;

  bool Validate(std::string* error) const;
  void Write(std::vector<std::uint8_t>* out) const;
  bool Read(BorshReader* reader);

  bool operator==(const PostBurnData& other) const = default;
};

struct PostMintData {
  static constexpr std::string_view kCategory = "forum";
  static constexpr std::string_view kOperation = "mint_for_post";

  RecordHeader header{kRecordVersion, std::string(kCategory), std::string(kOperation)};
  std::string user;
  std::uint64_t post_id{0};
  std::string message;

  bool Validate(std::string* error) const;
  void Write(std::vector<std::uint8_t>* out) const;
  bool Read(BorshReader* reader);

  bool operator==(const PostMintData& other) const = default;
};

struct ProjectCreationData {
  static constexpr std::string_view kCategory = "project";
  static constexpr std::string_view kOperation = "create_project";

  RecordHeader header{kRecordVersion, std::string(kCategory), std::string(kOperation)};
  std::uint64_t project_id{0};
  std::string name;
  std::string description;
  std::string image;
  std::string website;
  std::vector<std::string> tags;

  bool Validate(std::string* error) const;
  void Write(std::vector<std::uint8_t>* out) const;
  bool Read(BorshReader* reader);

  bool operator==(const ProjectCreationData& other) const = default;
};

struct ProjectUpdateData {
  static constexpr std::string_view kCategory = "project";
  static constexpr std::string_view kOperation = "update_project";

  RecordHeader header{kRecordVersion, std::string(kCategory), std::string(kOperation)};
  std::uint64_t project_id{0};
  std::optional<std::string> name;
  std::optional<std::string> description;
  std::optional<std::string> image;
  std::optional<std::string> website;
  std::optional<std::vector<std::string>> tags;

  bool Validate(std::string* error) const;
  void Write(std::vector<std::uint8_t>* out) const;
  bool Read(BorshReader* reader);

  bool operator==(const ProjectUpdateData& other) const = default;
};

struct ProjectBurnData {
  static constexpr std::string_view kCategory = "project";
  static constexpr std::string_view kOperation = "burn_for_project";

  RecordHeader header{kRecordVersion, std::string(kCategory), std::string(kOperation)};
  std::uint64_t project_id{0};
  std::string burner;
  std::string message;

  bool Validate(std::string* error) const;
  void Write(std::vector<std::uint8_t>* out) const;
  bool Read(BorshReader* reader);

  bool operator==(const ProjectBurnData& other) const = default;
};

// Group chat messages mint rather than burn, so the memo carries this record
// directly as Base64 with no burn envelope around it.
struct ChatMessageData {
  static constexpr std::string_view kCategory = "chat";
  static constexpr std::string_view kOperation = "send_message";

  RecordHeader header{kRecordVersion, std::string(kCategory), std::string(kOperation)};
  std::uint64_t group_id{0};
  std::string sender;
  std::string message;
  // Direct message target within the group.
  std::optional<std::string> receiver;
  std::optional<std::string> reply_to_sig;

  bool Validate(std::string* error) const;
  void Write(std::vector<std::uint8_t>* out) const;
  bool Read(BorshReader* reader);

  bool operator==(const ChatMessageData& other) const = default;
};

using DomainRecord =
    std::variant<ProfileCreationData, ProfileUpdateData, BlogCreationData, BlogUpdateData,
                 BlogBurnData, BlogMintData, PostCreationData, PostBurnData, PostMintData,
                 ProjectCreationData, ProjectUpdateData, ProjectBurnData>;

template <typename Record>
std::vector<std::uint8_t> SerializeRecord(const Record& record) {
  std::vector<std::uint8_t> out;
  record.Write(&out);
  return out;
}

// Decodes |payload| as |Record|; the record must span the payload exactly and
// carry the record's own category and operation tags.
template <typename Record>
bool DeserializeRecord(std::span<const std::uint8_t> payload, Record* record,
                       std::string* error = nullptr) {
  BorshReader reader(payload);
  Record parsed;
  if (!parsed.Read(&reader)) {
    if (error) *error = reader.error();
    return false;
  }
  if (!reader.AtEnd()) {
    if (error) *error = std::to_string(reader.remaining()) + " trailing bytes after record";
    return false;
  }
  if (parsed.header.category != Record::kCategory ||
      parsed.header.operation != Record::kOperation) {
    if (error) {
      *error = "record tagged " + parsed.header.category + "/" + parsed.header.operation +
               ", expected " + std::string(Record::kCategory) + "/" +
               std::string(Record::kOperation);
    }
    return false;
  }
  *record = std::move(parsed);
  return true;
}

struct DecodedMemo {
  std::uint64_t burn_amount{0};
  std::string category;
  std::string operation;
  DomainRecord record;
};

// Replays a memo read back from the ledger. Text that is not a known domain
// record (bad base64, unknown tags, garbage bytes) yields false.
bool DecodeDomainMemo(std::string_view memo_text, DecodedMemo* decoded,
                      std::string* error = nullptr);

// Base64 memo text for a chat message. The caller checks the length range.
std::string EncodeChatMemoText(const ChatMessageData& record);
bool DecodeChatMemo(std::string_view memo_text, ChatMessageData* record,
                    std::string* error = nullptr);

}  // namespace x1memo::codec
