// Adversarial testing for the address lookup table program
// Purpose: malformed instructions, corrupted account data and account lists
// that must be rejected without touching state

#include <gtest/gtest.h>
#include "svm/address_lookup_table/instruction.h"
#include "svm/address_lookup_table/program.h"
#include "svm/address_lookup_table/state.h"
#include "svm/system_program.h"
#include "svm/sysvars.h"
#include <memory>
#include <random>

using namespace altprog::common;
using namespace altprog::svm;
using namespace altprog::svm::address_lookup_table;

class LookupTableAdversarialTest : public ::testing::Test {
protected:
    ExecutionEngine engine;
    ExecutionContext context;
    PublicKey authority = PublicKey(PUBKEY_BYTES, 0xA2);
    PublicKey payer = PublicKey(PUBKEY_BYTES, 0xA1);
    PublicKey table;
    std::mt19937 rng{42};

    void SetUp() override {
        engine.register_builtin_program(std::make_unique<SystemProgram>());
        engine.register_builtin_program(std::make_unique<AddressLookupTableProgram>());

        context.slot = 10;
        std::vector<SlotHashes::Entry> entries;
        for (Slot slot = 0; slot < 10; ++slot) {
            entries.emplace_back(slot, Hash(HASH_BYTES, static_cast<uint8_t>(slot)));
        }
        ProgramAccount sysvar;
        sysvar.lamports = 1;
        sysvar.owner = system_program_id();
        sysvar.data = SlotHashes(std::move(entries)).serialize();
        context.accounts[slot_hashes_sysvar_id()] = sysvar;

        ProgramAccount funded;
        funded.lamports = 10000000000ULL;
        funded.owner = system_program_id();
        context.accounts[payer] = funded;

        auto created = create_lookup_table(authority, payer, 9);
        ASSERT_TRUE(engine.execute_transaction({created.first}, context).is_success());
        table = created.second;
    }

    std::vector<uint8_t> random_bytes(size_t size) {
        std::uniform_int_distribution<int> dist(0, 255);
        std::vector<uint8_t> bytes(size);
        for (auto& byte : bytes) {
            byte = static_cast<uint8_t>(dist(rng));
        }
        return bytes;
    }

    Instruction raw_instruction(std::vector<uint8_t> data) const {
        Instruction instruction = freeze_lookup_table(table, authority);
        instruction.data = std::move(data);
        return instruction;
    }
};

// Test 1: Truncated and oversized instruction payloads
TEST_F(LookupTableAdversarialTest, MalformedInstructionData) {
    LookupTableInstruction decoded;

    EXPECT_EQ(decode_instruction({}, decoded), ProgramError::InvalidInstructionData);
    EXPECT_EQ(decode_instruction({0, 0, 0}, decoded), ProgramError::InvalidInstructionData);
    EXPECT_EQ(decode_instruction({5, 0, 0, 0}, decoded), ProgramError::InvalidInstructionData);
    EXPECT_EQ(decode_instruction({0xFF, 0xFF, 0xFF, 0xFF}, decoded),
              ProgramError::InvalidInstructionData);

    // Create needs slot and bump
    EXPECT_EQ(decode_instruction({0, 0, 0, 0, 1, 2, 3, 4, 5, 6, 7, 8}, decoded),
              ProgramError::InvalidInstructionData);

    // Extend count disagrees with the payload
    std::vector<uint8_t> extend = encode_instruction(ExtendLookupTable{{PublicKey(PUBKEY_BYTES, 7)}});
    extend[4] = 2;
    EXPECT_EQ(decode_instruction(extend, decoded), ProgramError::InvalidInstructionData);
    extend[4] = 1;
    extend.push_back(0);
    EXPECT_EQ(decode_instruction(extend, decoded), ProgramError::InvalidInstructionData);

    // Absurd count with no addresses
    std::vector<uint8_t> huge = {2, 0, 0, 0, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF};
    EXPECT_EQ(decode_instruction(huge, decoded), ProgramError::InvalidInstructionData);
}

// Test 2: Trailing bytes after fixed-size payloads are tolerated
TEST_F(LookupTableAdversarialTest, TrailingBytesIgnored) {
    LookupTableInstruction decoded;

    std::vector<uint8_t> create = encode_instruction(CreateLookupTable{1234, 254});
    create.push_back(0xAB);
    ASSERT_TRUE(decode_instruction(create, decoded).is_ok());
    ASSERT_TRUE(std::holds_alternative<CreateLookupTable>(decoded));
    EXPECT_EQ(std::get<CreateLookupTable>(decoded).recent_slot, 1234u);
    EXPECT_EQ(std::get<CreateLookupTable>(decoded).bump_seed, 254);

    ASSERT_TRUE(decode_instruction({3, 0, 0, 0, 9, 9}, decoded).is_ok());
    EXPECT_TRUE(std::holds_alternative<DeactivateLookupTable>(decoded));
}

// Test 3: Random buffers never crash the state decoder
TEST_F(LookupTableAdversarialTest, RandomAccountDataFuzzing) {
    for (int iteration = 0; iteration < 2000; ++iteration) {
        std::uniform_int_distribution<size_t> size_dist(0, LOOKUP_TABLE_META_SIZE + 4 * PUBKEY_BYTES);
        std::vector<uint8_t> data = random_bytes(size_dist(rng));
        if (iteration % 2 == 0 && data.size() >= 4) {
            data[0] = 1;
            data[1] = data[2] = data[3] = 0;
        }

        ProgramState state = ProgramState::Uninitialized;
        LookupTableMeta meta;
        size_t count = 0;
        ProgramResult result = decode(data, state, meta, count);
        if (result.is_ok() && state == ProgramState::LookupTable) {
            EXPECT_EQ(LOOKUP_TABLE_META_SIZE + count * PUBKEY_BYTES, data.size());
            EXPECT_LE(count, LOOKUP_TABLE_MAX_ADDRESSES);
        } else if (result.is_err()) {
            EXPECT_EQ(result, ProgramError::InvalidAccountData);
        }
    }
}

// Test 4: Garbage instructions sent through the engine leave the table untouched
TEST_F(LookupTableAdversarialTest, EngineRejectsGarbageInstructions) {
    std::vector<uint8_t> before = context.accounts.at(table).data;

    for (int iteration = 0; iteration < 200; ++iteration) {
        std::uniform_int_distribution<size_t> size_dist(0, 64);
        std::vector<uint8_t> data = random_bytes(size_dist(rng));
        // Keep the tag out of range so every payload is malformed
        if (data.size() >= 4) {
            data[3] = 0x80;
        }

        ExecutionOutcome outcome = engine.execute_transaction({raw_instruction(data)}, context);
        EXPECT_FALSE(outcome.is_success());
        ASSERT_TRUE(outcome.program_error.has_value());
        EXPECT_EQ(*outcome.program_error, ProgramError::InvalidInstructionData);
    }

    EXPECT_EQ(context.accounts.at(table).data, before);
}

// Test 5: Account lists shorter than each instruction requires
TEST_F(LookupTableAdversarialTest, TooFewAccounts) {
    std::vector<Instruction> instructions = {
        freeze_lookup_table(table, authority),
        extend_lookup_table(table, authority, payer, {PublicKey(PUBKEY_BYTES, 1)}),
        deactivate_lookup_table(table, authority),
        close_lookup_table(table, authority, payer),
    };

    for (auto& instruction : instructions) {
        instruction.accounts.resize(1);
        ExecutionOutcome outcome = engine.execute_transaction({instruction}, context);
        ASSERT_TRUE(outcome.program_error.has_value());
        EXPECT_EQ(*outcome.program_error, ProgramError::NotEnoughAccountKeys);
    }

    Instruction close = close_lookup_table(table, authority, payer);
    close.accounts.resize(3);
    ExecutionOutcome outcome = engine.execute_transaction({close}, context);
    ASSERT_TRUE(outcome.program_error.has_value());
    EXPECT_EQ(*outcome.program_error, ProgramError::NotEnoughAccountKeys);
}

// Test 6: Corrupted table headers are reported, never reinterpreted
TEST_F(LookupTableAdversarialTest, CorruptedTableHeader) {
    auto table_data = [this]() -> std::vector<uint8_t>& { return context.accounts.at(table).data; };

    table_data()[AUTHORITY_TAG_OFFSET] = 7;
    ExecutionOutcome outcome = engine.execute_transaction(
        {deactivate_lookup_table(table, authority)}, context);
    ASSERT_TRUE(outcome.program_error.has_value());
    EXPECT_EQ(*outcome.program_error, ProgramError::InvalidAccountData);

    table_data()[AUTHORITY_TAG_OFFSET] = 1;
    table_data()[DISCRIMINANT_OFFSET] = 2;
    outcome = engine.execute_transaction({deactivate_lookup_table(table, authority)}, context);
    ASSERT_TRUE(outcome.program_error.has_value());
    EXPECT_EQ(*outcome.program_error, ProgramError::InvalidAccountData);

    // Partial address entry
    table_data()[DISCRIMINANT_OFFSET] = 1;
    table_data().resize(LOOKUP_TABLE_META_SIZE + 5);
    outcome = engine.execute_transaction({deactivate_lookup_table(table, authority)}, context);
    ASSERT_TRUE(outcome.program_error.has_value());
    EXPECT_EQ(*outcome.program_error, ProgramError::InvalidAccountData);
}

// Test 7: Table address must be derived from the signing authority
TEST_F(LookupTableAdversarialTest, ForeignAuthorityDerivation) {
    PublicKey impostor(PUBKEY_BYTES, 0xEE);
    auto legit = create_lookup_table(authority, payer, 8);
    auto forged = create_lookup_table(impostor, payer, 8);

    // Point the impostor's instruction at the authority's table address
    forged.first.accounts[0].pubkey = legit.second;
    ExecutionOutcome outcome = engine.execute_transaction({forged.first}, context);
    ASSERT_TRUE(outcome.program_error.has_value());
    EXPECT_EQ(*outcome.program_error, ProgramError::InvalidAuthority);
    EXPECT_EQ(context.accounts.count(legit.second), 0u);
}
