#include "codec/records.hpp"

#include "chain/pubkey.hpp"
#include "codec/memo.hpp"
#include "util/base64.hpp"

namespace x1memo::codec {

namespace {

bool SetError(std::string* error, std::string message) {
  if (error) *error = std::move(message);
  return false;
}

bool CheckHeader(const RecordHeader& header, std::string_view category,
                 std::string_view operation, std::string* error) {
  if (header.version != kRecordVersion) {
    return SetError(error, "version " + std::to_string(header.version) + " is not supported (expected " +
                               std::to_string(kRecordVersion) + ")");
  }
  if (header.category != category) {
    return SetError(error, "category '" + header.category + "' does not match '" +
                               std::string(category) + "'");
  }
  if (header.operation != operation) {
    return SetError(error, "operation '" + header.operation + "' does not match '" +
                               std::string(operation) + "'");
  }
  return true;
}

bool CheckMax(std::string_view field, std::string_view value, std::size_t max,
              std::string* error) {
  if (value.size() > max) {
    return SetError(error, std::string(field) + " is " + std::to_string(value.size()) +
                               " bytes (max: " + std::to_string(max) + ")");
  }
  return true;
}

bool CheckRequired(std::string_view field, std::string_view value, std::size_t max,
                   std::string* error) {
  if (value.empty()) {
    return SetError(error, std::string(field) + " must not be empty (1-" +
                               std::to_string(max) + " bytes)");
  }
  return CheckMax(field, value, max, error);
}

bool CheckOptionalRequired(std::string_view field, const std::optional<std::string>& value,
                           std::size_t max, std::string* error) {
  return !value || CheckRequired(field, *value, max, error);
}

bool CheckOptionalMax(std::string_view field, const std::optional<std::string>& value,
                      std::size_t max, std::string* error) {
  return !value || CheckMax(field, *value, max, error);
}

bool CheckAddress(std::string_view field, const std::string& value, std::string* error) {
  std::string parse_error;
  if (!chain::ParsePubkey(value, nullptr, &parse_error)) {
    return SetError(error, std::string(field) + ": " + parse_error);
  }
  return true;
}

bool CheckTags(const std::vector<std::string>& tags, std::string* error) {
  if (tags.size() > kMaxTags) {
    return SetError(error, "tags has " + std::to_string(tags.size()) + " entries (max: " +
                               std::to_string(kMaxTags) + ")");
  }
  for (std::size_t i = 0; i < tags.size(); ++i) {
    if (!CheckRequired("tags[" + std::to_string(i) + "]", tags[i], kMaxTagLength, error)) {
      return false;
    }
  }
  return true;
}

void WriteHeader(std::vector<std::uint8_t>* out, const RecordHeader& header) {
  WriteU8(out, header.version);
  WriteString(out, header.category);
  WriteString(out, header.operation);
}

bool ReadHeader(BorshReader* reader, RecordHeader* header) {
  return reader->ReadU8(&header->version, "version") &&
         reader->ReadString(&header->category, "category") &&
         reader->ReadString(&header->operation, "operation");
}

template <typename Record>
bool TryDecode(const RecordHeader& header, std::span<const std::uint8_t> payload,
               DomainRecord* out, bool* matched, std::string* error) {
  if (header.category != Record::kCategory || header.operation != Record::kOperation) {
    return false;
  }
  *matched = true;
  Record record;
  if (!DeserializeRecord(payload, &record, error)) {
    return false;
  }
  *out = std::move(record);
  return true;
}

}  // namespace

bool ProfileCreationData::Validate(std::string* error) const {
  return CheckHeader(header, kCategory, kOperation, error) &&
         CheckAddress("user_pubkey", user_pubkey, error) &&
         CheckRequired("username", username, kMaxUsernameLength, error) &&
         CheckMax("image", image, kMaxProfileImageLength, error) &&
         CheckOptionalMax("about_me", about_me, kMaxAboutMeLength, error);
}

void ProfileCreationData::Write(std::vector<std::uint8_t>* out) const {
  WriteHeader(out, header);
  WriteString(out, user_pubkey);
  WriteString(out, username);
  WriteString(out, image);
  WriteOptionString(out, about_me);
}

bool ProfileCreationData::Read(BorshReader* reader) {
  return ReadHeader(reader, &header) && reader->ReadString(&user_pubkey, "user_pubkey") &&
         reader->ReadString(&username, "username") && reader->ReadString(&image, "image") &&
         reader->ReadOptionString(&about_me, "about_me");
}

bool ProfileUpdateData::Validate(std::string* error) const {
  if (!CheckHeader(header, kCategory, kOperation, error) ||
      !CheckAddress("user_pubkey", user_pubkey, error) ||
      !CheckOptionalRequired("username", username, kMaxUsernameLength, error) ||
      !CheckOptionalMax("image", image, kMaxProfileImageLength, error)) {
    return false;
  }
  return !about_me || CheckOptionalMax("about_me", *about_me, kMaxAboutMeLength, error);
}

void ProfileUpdateData::Write(std::vector<std::uint8_t>* out) const {
  WriteHeader(out, header);
  WriteString(out, user_pubkey);
  WriteOptionString(out, username);
  WriteOptionString(out, image);
  WriteOptionOptionString(out, about_me);
}

bool ProfileUpdateData::Read(BorshReader* reader) {
  return ReadHeader(reader, &header) && reader->ReadString(&user_pubkey, "user_pubkey") &&
         reader->ReadOptionString(&username, "username") &&
         reader->ReadOptionString(&image, "image") &&
         reader->ReadOptionOptionString(&about_me, "about_me");
}

bool BlogCreationData::Validate(std::string* error) const {
  return CheckHeader(header, kCategory, kOperation, error) &&
         CheckRequired("name", name, kMaxNameLength, error) &&
         CheckMax("description", description, kMaxDescriptionLength, error) &&
         CheckMax("image", image, kMaxImageLength, error);
}

void BlogCreationData::Write(std::vector<std::uint8_t>* out) const {
  WriteHeader(out, header);
  WriteU64(out, blog_id);
  WriteString(out, name);
  WriteString(out, description);
  WriteString(out, image);
}

bool BlogCreationData::Read(BorshReader* reader) {
  return ReadHeader(reader, &header) && reader->ReadU64(&blog_id, "blog_id") &&
         reader->ReadString(&name, "name") && reader->ReadString(&description, "description") &&
         reader->ReadString(&image, "image");
}

bool BlogUpdateData::Validate(std::string* error) const {
  return CheckHeader(header, kCategory, kOperation, error) &&
         CheckOptionalRequired("name", name, kMaxNameLength, error) &&
         CheckOptionalMax("description", description, kMaxDescriptionLength, error) &&
         CheckOptionalMax("image", image, kMaxImageLength, error);
}

void BlogUpdateData::Write(std::vector<std::uint8_t>* out) const {
  WriteHeader(out, header);
  WriteU64(out, blog_id);
  WriteOptionString(out, name);
  WriteOptionString(out, description);
  WriteOptionString(out, image);
}

bool BlogUpdateData::Read(BorshReader* reader) {
  return ReadHeader(reader, &header) && reader->ReadU64(&blog_id, "blog_id") &&
         reader->ReadOptionString(&name, "name") &&
         reader->ReadOptionString(&description, "description") &&
         reader->ReadOptionString(&image, "image");
}

bool BlogBurnData::Validate(std::string* error) const {
  return CheckHeader(header, kCategory, kOperation, error) &&
         CheckAddress("burner", burner, error) &&
         CheckMax("message", message, kMaxBurnMessageLength, error);
}

void BlogBurnData::Write(std::vector<std::uint8_t>* out) const {
  WriteHeader(out, header);
  WriteU64(out, blog_id);
  WriteString(out, burner);
  WriteString(out, message);
}

bool BlogBurnData::Read(BorshReader* reader) {
  return ReadHeader(reader, &header) && reader->ReadU64(&blog_id, "blog_id") &&
         reader->ReadString(&burner, "burner") && reader->ReadString(&message, "message");
}

bool BlogMintData::Validate(std::string* error) const {
  return CheckHeader(header, kCategory, kOperation, error) &&
         CheckAddress("minter", minter, error) &&
         CheckMax("message", message, kMaxBurnMessageLength, error);
}

void BlogMintData::Write(std::vector<std::uint8_t>* out) const {
  WriteHeader(out, header);
  WriteU64(out, blog_id);
  WriteString(out, minter);
  WriteString(out, message);
}

bool BlogMintData::Read(BorshReader* reader) {
  return ReadHeader(reader, &header) && reader->ReadU64(&blog_id, "blog_id") &&
         reader->ReadString(&minter, "minter") && reader->ReadString(&message, "message");
}

bool PostCreationData::Validate(std::string* error) const {
  return CheckHeader(header, kCategory, kOperation, error) &&
         CheckAddress("creator", creator, error) &&
         CheckRequired("title", title, kMaxPostTitleLength, error) &&
         CheckRequired("content", content, kMaxPostContentLength, error) &&
         CheckMax("image", image, kMaxImageLength, error);
}

void PostCreationData::Write(std::vector<std::uint8_t>* out) const {
  WriteHeader(out, header);
  WriteString(out, creator);
  WriteU64(out, post_id);
  WriteString(out, title);
  WriteString(out, content);
  WriteString(out, image);
}

bool PostCreationData::Read(BorshReader* reader) {
  return ReadHeader(reader, &header) && reader->ReadString(&creator, "creator") &&
         reader->ReadU64(&post_id, "post_id") && reader->ReadString(&title, "title") &&
         reader->ReadString(&content, "content") && reader->ReadString(&image, "image");
}

bool PostBurnData::Validate(std::string* error) const {
  return CheckHeader(header, kCategory, kOperation, error) && CheckAddress("user", user, error) &&
         CheckMax("message", message, kMaxReplyLength, error);
}

void PostBurnData::Write(std::vector<std::uint8_t>* out) const {
  WriteHeader(out, header);
  WriteString(out, user);
  WriteU64(out, post_id);
  WriteString(out, message);
}

bool PostBurnData::Read(BorshReader* reader) {
  return ReadHeader(reader, &header) && reader->ReadString(&user, "user") &&
         reader->ReadU64(&post_id, "post_id") && reader->ReadString(&message, "message");
}

bool PostMintData::Validate(std::string* error) const {
  return CheckHeader(header, kCategory, kOperation, error) && CheckAddress("user", user, error) &&
         CheckMax("message", message, kMaxReplyLength, error);
}

void PostMintData::Write(std::vector<std::uint8_t>* out) const {
  WriteHeader(out, header);
  WriteString(out, user);
  WriteU64(out, post_id);
  WriteString(out, message);
}

bool PostMintData::Read(BorshReader* reader) {
  return ReadHeader(reader, &header) && reader->ReadString(&user, "user") &&
         reader->ReadU64(&post_id, "post_id") && reader->ReadString(&message, "message");
}

bool ProjectCreationData::Validate(std::string* error) const {
  return CheckHeader(header, kCategory, kOperation, error) &&
         CheckRequired("name", name, kMaxNameLength, error) &&
         CheckMax("description", description, kMaxDescriptionLength, error) &&
         CheckMax("image", image, kMaxImageLength, error) &&
         CheckMax("website", website, kMaxWebsiteLength, error) && CheckTags(tags, error);
}

void ProjectCreationData::Write(std::vector<std::uint8_t>* out) const {
  WriteHeader(out, header);
  WriteU64(out, project_id);
  WriteString(out, name);
  WriteString(out, description);
  WriteString(out, image);
  WriteString(out, website);
  WriteStringVector(out, tags);
}

bool ProjectCreationData::Read(BorshReader* reader) {
  return ReadHeader(reader, &header) && reader->ReadU64(&project_id, "project_id") &&
         reader->ReadString(&name, "name") && reader->ReadString(&description, "description") &&
         reader->ReadString(&image, "image") && reader->ReadString(&website, "website") &&
         reader->ReadStringVector(&tags, "tags");
}

bool ProjectUpdateData::Validate(std::string* error) const {
  return CheckHeader(header, kCategory, kOperation, error) &&
         CheckOptionalRequired("name", name, kMaxNameLength, error) &&
         CheckOptionalMax("description", description, kMaxDescriptionLength, error) &&
         CheckOptionalMax("image", image, kMaxImageLength, error) &&
         CheckOptionalMax("website", website, kMaxWebsiteLength, error) &&
         (!tags || CheckTags(*tags, error));
}

void ProjectUpdateData::Write(std::vector<std::uint8_t>* out) const {
  WriteHeader(out, header);
  WriteU64(out, project_id);
  WriteOptionString(out, name);
  WriteOptionString(out, description);
  WriteOptionString(out, image);
  WriteOptionString(out, website);
  WriteOptionStringVector(out, tags);
}

bool ProjectUpdateData::Read(BorshReader* reader) {
  return ReadHeader(reader, &header) && reader->ReadU64(&project_id, "project_id") &&
         reader->ReadOptionString(&name, "name") &&
         reader->ReadOptionString(&description, "description") &&
         reader->ReadOptionString(&image, "image") &&
         reader->ReadOptionString(&website, "website") &&
         reader->ReadOptionStringVector(&tags, "tags");
}

bool ProjectBurnData::Validate(std::string* error) const {
  return CheckHeader(header, kCategory, kOperation, error) &&
         CheckAddress("burner", burner, error) &&
         CheckMax("message", message, kMaxBurnMessageLength, error);
}

void ProjectBurnData::Write(std::vector<std::uint8_t>* out) const {
  WriteHeader(out, header);
  WriteU64(out, project_id);
  WriteString(out, burner);
  WriteString(out, message);
}

bool ProjectBurnData::Read(BorshReader* reader) {
  return ReadHeader(reader, &header) && reader->ReadU64(&project_id, "project_id") &&
         reader->ReadString(&burner, "burner") && reader->ReadString(&message, "message");
}

bool ChatMessageData::Validate(std::string* error) const {
  return CheckHeader(header, kCategory, kOperation, error) &&
         CheckAddress("sender", sender, error) &&
         CheckRequired("message", message, kMaxChatMessageLength, error) &&
         (!receiver || CheckAddress("receiver", *receiver, error));
}

void ChatMessageData::Write(std::vector<std::uint8_t>* out) const {
  WriteHeader(out, header);
  WriteU64(out, group_id);
  WriteString(out, sender);
  WriteString(out, message);
  WriteOptionString(out, receiver);
  WriteOptionString(out, reply_to_sig);
}

bool ChatMessageData::Read(BorshReader* reader) {
  return ReadHeader(reader, &header) && reader->ReadU64(&group_id, "group_id") &&
         reader->ReadString(&sender, "sender") && reader->ReadString(&message, "message") &&
         reader->ReadOptionString(&receiver, "receiver") &&
         reader->ReadOptionString(&reply_to_sig, "reply_to_sig");
}

std::string EncodeChatMemoText(const ChatMessageData& record) {
  return util::Base64Encode(SerializeRecord(record));
}

bool DecodeChatMemo(std::string_view memo_text, ChatMessageData* record, std::string* error) {
  std::vector<std::uint8_t> bytes;
  if (!util::Base64Decode(memo_text, &bytes)) {
    return SetError(error, "chat memo is not valid base64");
  }
  return DeserializeRecord(bytes, record, error);
}

bool DecodeDomainMemo(std::string_view memo_text, DecodedMemo* decoded, std::string* error) {
  BurnMemo memo;
  if (!DecodeMemoText(memo_text, &memo, error)) {
    return false;
  }
  RecordHeader header;
  BorshReader peek(memo.payload);
  if (!ReadHeader(&peek, &header)) {
    return SetError(error, "payload header: " + peek.error());
  }

  DomainRecord record;
  bool matched = false;
  const bool ok =
      TryDecode<ProfileCreationData>(header, memo.payload, &record, &matched, error) ||
      TryDecode<ProfileUpdateData>(header, memo.payload, &record, &matched, error) ||
      TryDecode<BlogCreationData>(header, memo.payload, &record, &matched, error) ||
      TryDecode<BlogUpdateData>(header, memo.payload, &record, &matched, error) ||
      TryDecode<BlogBurnData>(header, memo.payload, &record, &matched, error) ||
      TryDecode<BlogMintData>(header, memo.payload, &record, &matched, error) ||
      TryDecode<PostCreationData>(header, memo.payload, &record, &matched, error) ||
      TryDecode<PostBurnData>(header, memo.payload, &record, &matched, error) ||
      TryDecode<PostMintData>(header, memo.payload, &record, &matched, error) ||
      TryDecode<ProjectCreationData>(header, memo.payload, &record, &matched, error) ||
      TryDecode<ProjectUpdateData>(header, memo.payload, &record, &matched, error) ||
      TryDecode<ProjectBurnData>(header, memo.payload, &record, &matched, error);
  if (!ok) {
    if (!matched) {
      SetError(error, "unknown memo record " + header.category + "/" + header.operation);
    }
    return false;
  }
  if (decoded) {
    decoded->burn_amount = memo.burn_amount;
    decoded->category = std::move(header.category);
    decoded->operation = std::move(header.operation);
    decoded->record = std::move(record);
  }
  return true;
}

}  // namespace x1memo::codec
