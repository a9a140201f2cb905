/**
 * @file sskr_split_recover_example.cpp
 * @brief Split a secret into two groups of shares and recover it
 */

#include "sskr/engine/sskr.hpp"
#include "sskr/crypto/sodium_interop.hpp"

#include <iostream>
#include <iomanip>

using namespace sskr;
using namespace sskr::models;

void print_hex(const std::string& label, const std::vector<uint8_t>& data) {
    std::cout << label << ": ";
    for (auto byte : data) {
        std::cout << std::hex << std::setw(2) << std::setfill('0')
                  << static_cast<int>(byte);
    }
    std::cout << std::dec << std::endl;
}

int main() {
    std::cout << "=== SSKR - Split and Recover Example ===" << std::endl;
    std::cout << std::endl;

    std::cout << "1. Initializing libsodium..." << std::endl;
    auto init_result = crypto::SodiumInterop::Initialize();
    if (init_result.IsErr()) {
        std::cerr << "Failed to initialize: "
                  << init_result.UnwrapErr().message << std::endl;
        return 1;
    }
    std::cout << "   ✓ Initialized successfully" << std::endl;
    std::cout << std::endl;

    std::cout << "2. Generating a random 16-byte secret..." << std::endl;
    auto secret = crypto::SodiumInterop::GetRandomBytes(16);
    print_hex("   Secret", secret);
    std::cout << std::endl;

    // Both groups are needed (group threshold 2)
    std::cout << "3. Splitting with 2 of [2-of-3, 3-of-5]..." << std::endl;
    auto first_group = GroupSpec::Create(2, 3);
    auto second_group = GroupSpec::Create(3, 5);
    if (first_group.IsErr() || second_group.IsErr()) {
        std::cerr << "Invalid group parameters" << std::endl;
        return 1;
    }
    auto spec_result = SplitSpec::Create(
        2, {first_group.Unwrap(), second_group.Unwrap()});
    if (spec_result.IsErr()) {
        std::cerr << "Invalid split: " << spec_result.UnwrapErr().message << std::endl;
        return 1;
    }
    const auto& spec = spec_result.Unwrap();

    auto split_result = Sskr::Split(secret, spec);
    if (split_result.IsErr()) {
        std::cerr << "Split failed: " << split_result.UnwrapErr().message << std::endl;
        return 1;
    }
    const auto& shares = split_result.Unwrap();
    for (size_t i = 0; i < shares.size(); ++i) {
        print_hex("   Share " + std::to_string(i + 1), shares[i]);
    }
    std::cout << std::endl;

    // Shares 0-2 belong to group 1, shares 3-7 to group 2
    std::cout << "4. Recovering from 2 shares of group 1 and 3 shares of group 2..." << std::endl;
    const std::vector<std::vector<uint8_t>> qualifying = {
        shares[2], shares[0], shares[7], shares[3], shares[5]
    };
    auto recover_result = Sskr::Recombine(qualifying);
    if (recover_result.IsErr()) {
        std::cerr << "Recovery failed: " << recover_result.UnwrapErr().message << std::endl;
        return 1;
    }
    print_hex("   Recovered", recover_result.Unwrap());
    std::cout << "   " << (recover_result.Unwrap() == secret ? "✓ Secrets match" : "✗ Secrets differ")
              << std::endl;
    std::cout << std::endl;

    std::cout << "5. Attempting recovery with only group 1..." << std::endl;
    const std::vector<std::vector<uint8_t>> insufficient = {shares[0], shares[1], shares[2]};
    auto rejected = Sskr::Recombine(insufficient);
    if (rejected.IsOk()) {
        std::cerr << "Recovery unexpectedly succeeded" << std::endl;
        return 1;
    }
    std::cout << "   ✓ Rejected (" << ToString(rejected.UnwrapErr().type) << "): "
              << rejected.UnwrapErr().message << std::endl;
    std::cout << std::endl;

    std::cout << "6. Wiping secret buffers..." << std::endl;
    if (crypto::SodiumInterop::SecureWipe(secret).IsErr() ||
        crypto::SodiumInterop::SecureWipe(recover_result.Unwrap()).IsErr()) {
        std::cerr << "Failed to wipe secret buffers" << std::endl;
        return 1;
    }
    std::cout << "   ✓ Wiped" << std::endl;
    std::cout << std::endl;

    std::cout << "=== Example completed successfully ===" << std::endl;
    return 0;
}
