/**
 * ML-KEM Demo
 * Demonstrates post-quantum key encapsulation using ML-KEM (FIPS 203)
 *
 * Usage: mlkem_demo [ML-KEM-512|ML-KEM-768|ML-KEM-1024]
 * Without an argument every parameter set is demonstrated.
 */

#include "common/algorithm_factory.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <span>
#include <string>
#include <vector>

void print_hex(std::span<const uint8_t> data, size_t max_bytes = 32) {
    size_t to_print = std::min(data.size(), max_bytes);
    for (size_t i = 0; i < to_print; ++i) {
        std::cout << std::hex << std::setw(2) << std::setfill('0')
                  << static_cast<int>(data[i]);
    }
    if (data.size() > max_bytes) {
        std::cout << "...";
    }
    std::cout << std::dec << std::setfill(' ');
}

void demo_kem(const pqc::KeyEncapsulation& kem) {
    std::cout << "\n" << std::string(60, '=') << std::endl;
    std::cout << kem.name() << " (" << kem.standard() << ")" << std::endl;
    std::cout << std::string(60, '=') << std::endl;

    std::cout << "\n[1] Receiver generates a key pair" << std::endl;
    auto [ek, dk] = kem.keygen();
    std::cout << "    ek: " << ek.size() << " bytes, dk: " << dk.size() << " bytes" << std::endl;
    std::cout << "    ek prefix: ";
    print_hex(ek, 16);
    std::cout << std::endl;
    std::cout << "    ek check: " << (kem.check_encapsulation_key(ek) ? "ok" : "FAILED")
              << ", dk check: " << (kem.check_decapsulation_key(dk) ? "ok" : "FAILED") << std::endl;

    std::cout << "\n[2] Sender encapsulates to ek" << std::endl;
    auto [ciphertext, K_sender] = kem.encaps(ek);
    std::cout << "    ciphertext: " << ciphertext.size() << " bytes" << std::endl;
    std::cout << "    K (sender):   ";
    print_hex(K_sender);
    std::cout << std::endl;

    std::cout << "\n[3] Receiver decapsulates" << std::endl;
    auto K_receiver = kem.decaps(dk, ciphertext);
    std::cout << "    K (receiver): ";
    print_hex(K_receiver);
    std::cout << std::endl;
    std::cout << "    keys agree: " << (K_sender == K_receiver ? "yes" : "NO") << std::endl;

    std::cout << "\n[4] Implicit rejection of a modified ciphertext" << std::endl;
    std::vector<uint8_t> tampered = ciphertext;
    tampered.back() ^= 0x80;
    auto K_rejected = kem.decaps(dk, tampered);
    std::cout << "    K (rejected): ";
    print_hex(K_rejected);
    std::cout << std::endl;
    std::cout << "    differs from K: " << (K_rejected != K_sender ? "yes" : "NO") << std::endl;

    std::cout << "\n[5] Seeded run is reproducible" << std::endl;
    std::vector<uint8_t> seed(64, 0x11);
    std::vector<uint8_t> m(32, 0x22);
    auto first = kem.encaps(kem.keygen(seed).encapsulation_key, m);
    auto second = kem.encaps(kem.keygen(seed).encapsulation_key, m);
    std::cout << "    same ciphertext and K: "
              << (first.ciphertext == second.ciphertext &&
                  first.shared_secret == second.shared_secret ? "yes" : "NO") << std::endl;
}

void print_comparison() {
    std::cout << "\n" << std::string(72, '=') << std::endl;
    std::cout << std::left << std::setw(14) << "Parameter"
              << std::setw(4) << "k"
              << std::setw(7) << "eta1"
              << std::setw(7) << "eta2"
              << std::setw(5) << "du"
              << std::setw(5) << "dv"
              << std::setw(10) << "ek"
              << std::setw(10) << "dk"
              << std::setw(10) << "ct"
              << std::endl;
    std::cout << std::string(72, '-') << std::endl;

    for (auto set : {mlkem::ParameterSet::MLKEM512, mlkem::ParameterSet::MLKEM768,
                     mlkem::ParameterSet::MLKEM1024}) {
        const auto& p = mlkem::params_for(set);
        std::cout << std::setw(14) << p.name
                  << std::setw(4) << p.k
                  << std::setw(7) << p.eta1
                  << std::setw(7) << p.eta2
                  << std::setw(5) << p.du
                  << std::setw(5) << p.dv
                  << std::setw(10) << p.ek_size()
                  << std::setw(10) << p.dk_size()
                  << std::setw(10) << p.ct_size()
                  << std::endl;
    }
    std::cout << std::string(72, '=') << std::endl;
}

int main(int argc, char* argv[]) {
    std::cout << std::string(60, '=') << std::endl;
    std::cout << "    Post-Quantum Key Encapsulation (ML-KEM / FIPS 203)" << std::endl;
    std::cout << std::string(60, '=') << std::endl;

    std::vector<std::string> selected;
    if (argc > 1) {
        selected.emplace_back(argv[1]);
    } else {
        selected = pqc::available_kem_algorithms();
    }

    try {
        for (const auto& name : selected) {
            auto kem = pqc::create_kem(name);
            demo_kem(*kem);
        }
    } catch (const mlkem::InvalidParameterSet& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << "Available:";
        for (const auto& name : pqc::available_kem_algorithms()) {
            std::cerr << " " << name;
        }
        std::cerr << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    print_comparison();
    return 0;
}
