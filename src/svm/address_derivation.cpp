#include "svm/address_derivation.h"
#include "common/crypto_utils.h"
#include <cstring>

namespace altprog {
namespace svm {

const char PDA_MARKER[] = "ProgramDerivedAddress";

ProgramResult create_program_address(const SignerSeeds& seeds,
                                      const PublicKey& program_id,
                                      PublicKey& address) {
    if (seeds.size() > MAX_SEEDS) {
        return ProgramError::InvalidSeeds;
    }
    for (const auto& seed : seeds) {
        if (seed.size() > MAX_SEED_LEN) {
            return ProgramError::InvalidSeeds;
        }
    }

    std::vector<std::vector<uint8_t>> chunks(seeds.begin(), seeds.end());
    chunks.push_back(program_id);
    chunks.emplace_back(PDA_MARKER, PDA_MARKER + std::strlen(PDA_MARKER));

    Hash hash = CryptoUtils::sha256_multi(chunks);
    if (CryptoUtils::is_on_ed25519_curve(hash)) {
        return ProgramError::InvalidSeeds;
    }

    address = std::move(hash);
    return ProgramResult::ok();
}

std::optional<std::pair<PublicKey, uint8_t>> find_program_address(
    const SignerSeeds& seeds, const PublicKey& program_id) {
    SignerSeeds with_bump(seeds);
    with_bump.push_back({0});

    for (int bump = 255; bump >= 0; --bump) {
        with_bump.back()[0] = static_cast<uint8_t>(bump);
        PublicKey address;
        if (create_program_address(with_bump, program_id, address).is_ok()) {
            return std::make_pair(address, static_cast<uint8_t>(bump));
        }
    }
    return std::nullopt;
}

} // namespace svm
} // namespace altprog
