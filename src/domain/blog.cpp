#include "domain/blog.hpp"

#include <stdexcept>

#include "chain/pda.hpp"
#include "chain/program_ids.hpp"
#include "domain/common.hpp"
#include "util/log.hpp"

namespace x1memo::domain {

chain::Pubkey BlogCounterAddress(const chain::Pubkey& blog_program) {
  return chain::FindProgramAddress({chain::SeedOf("global_blog_counter")}, blog_program).address;
}

chain::Pubkey BlogAddress(std::uint64_t blog_id, const chain::Pubkey& blog_program) {
  const auto id = IdSeed(blog_id);
  return chain::FindProgramAddress({chain::SeedOf("blog"), id}, blog_program).address;
}

BlogService::BlogService(std::shared_ptr<const engine::TransactionPipeline> pipeline,
                         config::NetworkConfig network)
    : pipeline_(std::move(pipeline)), network_(std::move(network)) {
  if (!pipeline_) {
    throw std::invalid_argument("BlogService requires a pipeline");
  }
}

// user, blog, mint, token account, burn stats, token program, burn program,
// sysvar instructions: shared by update_blog and burn_for_blog.
std::vector<tx::AccountMeta> BlogService::BurnAccounts(const chain::Pubkey& user,
                                                       std::uint64_t blog_id) const {
  const auto& programs = network_.programs;
  return {
      tx::AccountMeta::Writable(user, true),
      tx::AccountMeta::Writable(BlogAddress(blog_id, programs.blog_program)),
      tx::AccountMeta::Writable(programs.token_mint),
      tx::AccountMeta::Writable(
          chain::AssociatedTokenAddress(user, programs.token_mint, programs.token_program)),
      tx::AccountMeta::Writable(UserBurnStatsAddress(user, programs.burn_program)),
      tx::AccountMeta::ReadOnly(programs.token_program),
      tx::AccountMeta::ReadOnly(programs.burn_program),
      tx::AccountMeta::ReadOnly(chain::SysvarInstructionsId()),
  };
}

engine::OperationDescriptor BlogService::DescribeCreate(const chain::Pubkey& user,
                                                        const codec::BlogCreationData& record,
                                                        std::uint64_t burn_amount) const {
  RequireBurnAmount(burn_amount, kBlogMinBurn, true);
  const auto& programs = network_.programs;

  engine::OperationDescriptor op;
  op.name = "create_blog";
  op.memo_text = engine::EncodeRecordMemo(record, burn_amount);
  op.policy = engine::ContentComputePolicy();

  tx::Instruction instruction;
  instruction.program_id = programs.blog_program;
  instruction.data = InstructionData("create_blog", {record.blog_id, burn_amount});
  instruction.accounts = {
      tx::AccountMeta::Writable(user, true),
      tx::AccountMeta::Writable(BlogCounterAddress(programs.blog_program)),
      tx::AccountMeta::Writable(BlogAddress(record.blog_id, programs.blog_program)),
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

engine::OperationDescriptor BlogService::DescribeUpdate(const chain::Pubkey& user,
                                                        const codec::BlogUpdateData& record,
                                                        std::uint64_t burn_amount) const {
  RequireBurnAmount(burn_amount, kBlogMinBurn, true);
  engine::OperationDescriptor op;
  op.name = "update_blog";
  op.memo_text = engine::EncodeRecordMemo(record, burn_amount);
  op.policy = engine::ContentComputePolicy();

  tx::Instruction instruction;
  instruction.program_id = network_.programs.blog_program;
  instruction.data = InstructionData("update_blog", {record.blog_id, burn_amount});
  instruction.accounts = BurnAccounts(user, record.blog_id);
  op.program_instructions.push_back(std::move(instruction));
  return op;
}

engine::OperationDescriptor BlogService::DescribeBurn(const chain::Pubkey& user,
                                                      const codec::BlogBurnData& record,
                                                      std::uint64_t burn_amount) const {
  RequireBurnAmount(burn_amount, kBlogMinBurn, true);
  RequireRecordAddress("burner", record.burner, user);
  engine::OperationDescriptor op;
  op.name = "burn_for_blog";
  op.memo_text = engine::EncodeRecordMemo(record, burn_amount);
  op.policy = engine::ContentComputePolicy();

  tx::Instruction instruction;
  instruction.program_id = network_.programs.blog_program;
  instruction.data = InstructionData("burn_for_blog", {record.blog_id, burn_amount});
  instruction.accounts = BurnAccounts(user, record.blog_id);
  op.program_instructions.push_back(std::move(instruction));
  return op;
}

engine::OperationDescriptor BlogService::DescribeMint(const chain::Pubkey& user,
                                                      const codec::BlogMintData& record) const {
  RequireRecordAddress("minter", record.minter, user);
  const auto& programs = network_.programs;
  engine::OperationDescriptor op;
  op.name = "mint_for_blog";
  op.memo_text = engine::EncodeRecordMemo(record, 0);
  op.policy = engine::ContentComputePolicy();

  tx::Instruction instruction;
  instruction.program_id = programs.blog_program;
  instruction.data = InstructionData("mint_for_blog", {record.blog_id});
  instruction.accounts = {
      tx::AccountMeta::Writable(user, true),
      tx::AccountMeta::Writable(BlogAddress(record.blog_id, programs.blog_program)),
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

engine::BuiltTransaction BlogService::BuildCreate(const chain::Pubkey& user,
                                                  codec::BlogCreationData record,
                                                  std::uint64_t burn_amount) const {
  record.blog_id = TotalBlogs();
  util::LogInfo("blog", "creating blog " + std::to_string(record.blog_id));
  return pipeline_->Build(DescribeCreate(user, record, burn_amount), user);
}

engine::BuiltTransaction BlogService::BuildUpdate(const chain::Pubkey& user,
                                                  const codec::BlogUpdateData& record,
                                                  std::uint64_t burn_amount) const {
  return pipeline_->Build(DescribeUpdate(user, record, burn_amount), user);
}

engine::BuiltTransaction BlogService::BuildBurn(const chain::Pubkey& user,
                                                const codec::BlogBurnData& record,
                                                std::uint64_t burn_amount) const {
  return pipeline_->Build(DescribeBurn(user, record, burn_amount), user);
}

engine::BuiltTransaction BlogService::BuildMint(const chain::Pubkey& user,
                                                const codec::BlogMintData& record) const {
  return pipeline_->Build(DescribeMint(user, record), user);
}

std::uint64_t BlogService::TotalBlogs() const {
  const auto& program = network_.programs.blog_program;
  return FetchGlobalCounter(pipeline_->client(), BlogCounterAddress(program), program,
                            "blog counter");
}

std::optional<accounts::BlogInfo> BlogService::Fetch(std::uint64_t blog_id) const {
  const auto& program = network_.programs.blog_program;
  const auto account =
      FetchOwnedAccount(pipeline_->client(), BlogAddress(blog_id, program), program, "blog");
  if (!account) {
    return std::nullopt;
  }
  auto blog = ParseAccountOrThrow<accounts::BlogInfo>(accounts::ParseBlogInfo, account->data, "blog");
  RequireRecordId("blog_id", blog.blog_id, blog_id);
  return blog;
}

bool BlogService::Exists(std::uint64_t blog_id) const { return Fetch(blog_id).has_value(); }

BlogStatistics BlogService::FetchAll() const {
  auto bulk = FetchBulk<accounts::BlogInfo>(
      TotalBlogs(), "blog",
      [this](std::uint64_t id) {
        auto blog = Fetch(id);
        if (!blog) {
          throw rpc::RpcError(rpc::ErrorKind::kOther, "blog account missing");
        }
        return std::move(*blog);
      },
      [](const accounts::BlogInfo& blog) { return blog.blog_id; });

  BlogStatistics stats;
  stats.total_blogs = bulk.total;
  stats.valid_blogs = bulk.valid;
  for (const auto& blog : bulk.records) {
    stats.total_memos += blog.memo_count;
    stats.total_burned += blog.burned_amount;
    stats.total_minted += blog.minted_amount;
  }
  stats.blogs = std::move(bulk.records);
  return stats;
}

MemoHistory BlogService::History(std::uint64_t blog_id, std::size_t limit,
                                 const std::optional<std::string>& before) const {
  return ReplayMemoHistory(pipeline_->client(),
                           BlogAddress(blog_id, network_.programs.blog_program), limit, before);
}

}  // namespace x1memo::domain
