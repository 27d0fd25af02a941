/**
 * Fuzz target for ML-KEM encapsulation
 *
 * Tests that malformed encapsulation keys don't cause crashes or memory corruption.
 * This complements fuzz_mlkem_decaps by testing the encapsulation path.
 * Run with: ./fuzz_mlkem_encaps -max_len=2000 -timeout=5
 */

#include <cstdint>
#include <cstddef>
#include <cstdlib>
#include <span>
#include <vector>

#include "mlkem/mlkem.hpp"

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    if (size < 2) return 0;

    // Use first byte to select parameter set
    const auto& params = mlkem::params_for(static_cast<mlkem::ParameterSet>(data[0] % 3));
    std::span<const uint8_t> fuzz_ek(data + 1, size - 1);

    mlkem::MLKEM kem(params);

    if (fuzz_ek.size() != params.ek_size()) {
        try {
            (void)kem.encaps(fuzz_ek);
        } catch (const mlkem::InvalidLength&) {
            return 0;
        }
        std::abort();
    }

    // Fixed randomness keeps a crashing input reproducible
    std::vector<uint8_t> m(mlkem::MLKEM::ENCAPS_SEED_BYTES, 0x3C);
    auto [ct, ss] = kem.encaps(fuzz_ek, m);
    if (ct.size() != params.ct_size()) std::abort();

    // Encaps is deterministic in (ek, m)
    auto again = kem.encaps(fuzz_ek, m);
    if (again.ciphertext != ct || again.shared_secret != ss) std::abort();

    // Unreduced coefficients are accepted here; the key check flags them
    (void)kem.check_encapsulation_key(fuzz_ek);

    return 0;
}
