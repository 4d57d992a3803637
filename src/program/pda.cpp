// LOCKBOX - Program Derived Addresses Implementation
// Copyright (c) 2024 LOCKBOX Developers
// MIT License

#include "lockbox/program/pda.h"
#include "lockbox/crypto/keys.h"
#include "lockbox/crypto/sha256.h"


namespace lockbox {

const char* const LOCKBOX_SEED = "lockbox";
const char* const VAULT_SEED = "vault";
const char* const PDA_MARKER = "ProgramDerivedAddress";

Seed MakeSeed(const std::string& str) {
    return Seed(str.begin(), str.end());
}

Seed MakeSeed(const Address& address) {
    return Seed(address.begin(), address.end());
}

Address DefaultProgramId() {
    return Address(SHA256Hash(std::string("lockbox.program.v1")));
}

std::optional<Address> CreateProgramAddress(const Seeds& seeds, const Address& programId) {
    if (seeds.size() > MAX_SEEDS) {
        return std::nullopt;
    }
    
    SHA256 hasher;
    for (const auto& seed : seeds) {
        if (seed.size() > MAX_SEED_LEN) {
            return std::nullopt;
        }
        hasher.Write(seed.data(), seed.size());
    }
    hasher.Write(programId.data(), programId.size());
    hasher.Write(std::string(PDA_MARKER));
    
    Byte digest[SHA256::OUTPUT_SIZE];
    hasher.Finalize(digest);
    Address result(digest, sizeof(digest));
    
    if (IsOnCurve(result)) {
        return std::nullopt;
    }
    return result;
}

std::optional<std::pair<Address, uint8_t>> FindProgramAddress(const Seeds& seeds,
                                                              const Address& programId) {
    // The bump occupies one seed slot
    if (seeds.size() >= MAX_SEEDS) {
        return std::nullopt;
    }
    
    Seeds withBump = seeds;
    withBump.push_back(Seed{0});
    
    for (int bump = 255; bump >= 0; --bump) {
        withBump.back()[0] = static_cast<Byte>(bump);
        auto address = CreateProgramAddress(withBump, programId);
        if (address) {
            return std::make_pair(*address, static_cast<uint8_t>(bump));
        }
    }
    return std::nullopt;
}

Seeds LockBoxSeeds(const Address& owner) {
    return Seeds{MakeSeed(LOCKBOX_SEED), MakeSeed(owner)};
}

Seeds VaultSeeds(const Address& lockbox) {
    return Seeds{MakeSeed(VAULT_SEED), MakeSeed(lockbox)};
}

Seeds WithBump(Seeds seeds, uint8_t bump) {
    seeds.push_back(Seed{bump});
    return seeds;
}

std::optional<std::pair<Address, uint8_t>> DeriveLockBoxAddress(const Address& owner,
                                                                const Address& programId) {
    return FindProgramAddress(LockBoxSeeds(owner), programId);
}

std::optional<std::pair<Address, uint8_t>> DeriveVaultAddress(const Address& lockbox,
                                                              const Address& programId) {
    return FindProgramAddress(VaultSeeds(lockbox), programId);
}

} // namespace lockbox
