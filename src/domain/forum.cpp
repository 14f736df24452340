#include "domain/forum.hpp"

#include <stdexcept>
#include <variant>

#include "chain/pda.hpp"
#include "chain/program_ids.hpp"
#include "domain/common.hpp"
#include "domain/history.hpp"
#include "util/log.hpp"

namespace x1memo::domain {

chain::Pubkey ForumCounterAddress(const chain::Pubkey& forum_program) {
  return chain::FindProgramAddress({chain::SeedOf("global_counter")}, forum_program).address;
}

chain::Pubkey PostAddress(std::uint64_t post_id, const chain::Pubkey& forum_program) {
  const auto id = IdSeed(post_id);
  return chain::FindProgramAddress({chain::SeedOf("post"), id}, forum_program).address;
}

std::size_t EstimateCreatePostMemoSize(const codec::PostCreationData& record) {
  return engine::EstimateRecordMemoSize(record);
}

std::size_t EstimateBurnForPostMemoSize(const codec::PostBurnData& record) {
  return engine::EstimateRecordMemoSize(record);
}

std::size_t EstimateMintForPostMemoSize(const codec::PostMintData& record) {
  return engine::EstimateRecordMemoSize(record);
}

ForumService::ForumService(std::shared_ptr<const engine::TransactionPipeline> pipeline,
                           config::NetworkConfig network)
    : pipeline_(std::move(pipeline)), network_(std::move(network)) {
  if (!pipeline_) {
    throw std::invalid_argument("ForumService requires a pipeline");
  }
}

engine::OperationDescriptor ForumService::DescribeCreatePost(
    const chain::Pubkey& user, const codec::PostCreationData& record,
    std::uint64_t burn_amount) const {
  RequireBurnAmount(burn_amount, kPostMinBurn, true);
  RequireRecordAddress("creator", record.creator, user);
  const auto& programs = network_.programs;

  engine::OperationDescriptor op;
  op.name = "create_post";
  op.memo_text = engine::EncodeRecordMemo(record, burn_amount);
  op.policy = engine::ContentComputePolicy();

  tx::Instruction instruction;
  instruction.program_id = programs.forum_program;
  instruction.data = InstructionData("create_post", {record.post_id, burn_amount});
  instruction.accounts = {
      tx::AccountMeta::Writable(user, true),
      tx::AccountMeta::Writable(ForumCounterAddress(programs.forum_program)),
      tx::AccountMeta::Writable(PostAddress(record.post_id, programs.forum_program)),
      tx::AccountMeta::Writable(programs.token_mint),
      tx::AccountMeta::Writable(
          chain::AssociatedTokenAddress(user, programs.token_mint, programs.token_program)),
      tx::AccountMeta::Writable(UserBurnStatsAddress(user, programs.burn_program)),
      tx::AccountMeta::ReadOnly(programs.token_program),
      tx::AccountMeta::ReadOnly(programs.burn_program),
      tx::AccountMeta::ReadOnly(chain::SystemProgramId()),
      tx::AccountMeta::ReadOnly(chain::SysvarInstructionsId()),
  };
  op.program_instructions.push_back(std::move(instruction));
  return op;
}

engine::OperationDescriptor ForumService::DescribeBurnForPost(
    const chain::Pubkey& user, const codec::PostBurnData& record,
    std::uint64_t burn_amount) const {
  RequireBurnAmount(burn_amount, kPostMinBurn, true);
  RequireRecordAddress("user", record.user, user);
  const auto& programs = network_.programs;

  engine::OperationDescriptor op;
  op.name = "burn_for_post";
  op.memo_text = engine::EncodeRecordMemo(record, burn_amount);
  op.policy = engine::ContentComputePolicy();

  tx::Instruction instruction;
  instruction.program_id = programs.forum_program;
  instruction.data = InstructionData("burn_for_post", {record.post_id, burn_amount});
  instruction.accounts = {
      tx::AccountMeta::Writable(user, true),
      tx::AccountMeta::Writable(PostAddress(record.post_id, programs.forum_program)),
      tx::AccountMeta::Writable(programs.token_mint),
      tx::AccountMeta::Writable(
          chain::AssociatedTokenAddress(user, programs.token_mint, programs.token_program)),
      tx::AccountMeta::Writable(UserBurnStatsAddress(user, programs.burn_program)),
      tx::AccountMeta::ReadOnly(programs.token_program),
      tx::AccountMeta::ReadOnly(programs.burn_program),
      tx::AccountMeta::ReadOnly(chain::SysvarInstructionsId()),
  };
  op.program_instructions.push_back(std::move(instruction));
  return op;
}

engine::OperationDescriptor ForumService::DescribeMintForPost(
    const chain::Pubkey& user, const codec::PostMintData& record) const {
  RequireRecordAddress("user", record.user, user);
  const auto& programs = network_.programs;

  engine::OperationDescriptor op;
  op.name = "mint_for_post";
  op.memo_text = engine::EncodeRecordMemo(record, 0);
  op.policy = engine::ContentComputePolicy();

  tx::Instruction instruction;
  instruction.program_id = programs.forum_program;
  instruction.data = InstructionData("mint_for_post", {record.post_id});
  instruction.accounts = {
      tx::AccountMeta::Writable(user, true),
      tx::AccountMeta::Writable(PostAddress(record.post_id, programs.forum_program)),
      tx::AccountMeta::Writable(programs.token_mint),
      tx::AccountMeta::ReadOnly(MintAuthorityAddress(programs.mint_program)),
      tx::AccountMeta::Writable(
          chain::AssociatedTokenAddress(user, programs.token_mint, programs.token_program)),
      tx::AccountMeta::ReadOnly(programs.token_program),
      tx::AccountMeta::ReadOnly(programs.mint_program),
      tx::AccountMeta::ReadOnly(chain::SysvarInstructionsId()),
  };
  op.program_instructions.push_back(std::move(instruction));
  return op;
}

engine::BuiltTransaction ForumService::BuildCreatePost(const chain::Pubkey& user,
                                                       codec::PostCreationData record,
                                                       std::uint64_t burn_amount) const {
  record.post_id = TotalPosts();
  util::LogInfo("forum", "creating post " + std::to_string(record.post_id));
  return pipeline_->Build(DescribeCreatePost(user, record, burn_amount), user);
}

engine::BuiltTransaction ForumService::BuildBurnForPost(const chain::Pubkey& user,
                                                        const codec::PostBurnData& record,
                                                        std::uint64_t burn_amount) const {
  return pipeline_->Build(DescribeBurnForPost(user, record, burn_amount), user);
}

engine::BuiltTransaction ForumService::BuildMintForPost(const chain::Pubkey& user,
                                                        const codec::PostMintData& record) const {
  return pipeline_->Build(DescribeMintForPost(user, record), user);
}

std::uint64_t ForumService::TotalPosts() const {
  const auto& program = network_.programs.forum_program;
  return FetchGlobalCounter(pipeline_->client(), ForumCounterAddress(program), program,
                            "forum counter");
}

std::optional<accounts::PostInfo> ForumService::Fetch(std::uint64_t post_id) const {
  const auto& program = network_.programs.forum_program;
  const auto account =
      FetchOwnedAccount(pipeline_->client(), PostAddress(post_id, program), program, "post");
  if (!account) {
    return std::nullopt;
  }
  auto post = ParseAccountOrThrow<accounts::PostInfo>(accounts::ParsePostInfo, account->data, "post");
  RequireRecordId("post_id", post.post_id, post_id);
  return post;
}

bool ForumService::Exists(std::uint64_t post_id) const { return Fetch(post_id).has_value(); }

ForumStatistics ForumService::FetchAll() const {
  auto bulk = FetchBulk<accounts::PostInfo>(
      TotalPosts(), "post",
      [this](std::uint64_t id) {
        auto post = Fetch(id);
        if (!post) {
          throw rpc::RpcError(rpc::ErrorKind::kOther, "post account missing");
        }
        return std::move(*post);
      },
      [](const accounts::PostInfo& post) { return post.post_id; });

  ForumStatistics stats;
  stats.total_posts = bulk.total;
  stats.valid_posts = bulk.valid;
  for (const auto& post : bulk.records) {
    stats.total_replies += post.reply_count;
    stats.total_burned += post.burned_amount;
  }
  stats.posts = std::move(bulk.records);
  return stats;
}

PostReplies ForumService::Replies(std::uint64_t post_id, std::size_t limit,
                                  const std::optional<std::string>& before) const {
  if (!Exists(post_id)) {
    throw rpc::RpcError(rpc::ErrorKind::kOther, "post " + std::to_string(post_id) + " not found");
  }
  const auto history = ReplayMemoHistory(
      pipeline_->client(), PostAddress(post_id, network_.programs.forum_program), limit, before);

  PostReplies result;
  result.post_id = post_id;
  result.has_more = history.has_more;
  for (const auto& entry : history.entries) {
    PostReply reply;
    reply.signature = entry.signature;
    reply.timestamp = entry.block_time;
    reply.slot = entry.slot;
    reply.burn_amount = entry.memo.burn_amount;
    if (const auto* burn = std::get_if<codec::PostBurnData>(&entry.memo.record)) {
      if (burn->post_id != post_id) continue;
      reply.user = burn->user;
      reply.message = burn->message;
    } else if (const auto* mint = std::get_if<codec::PostMintData>(&entry.memo.record)) {
      if (mint->post_id != post_id) continue;
      reply.user = mint->user;
      reply.message = mint->message;
      reply.is_mint = true;
    } else {
      continue;
    }
    result.replies.push_back(std::move(reply));
  }
  return result;
}

}  // namespace x1memo::domain
