#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include <semaphore/semaphore.hpp>

using namespace semaphore;

static const char* TOPIC = "The Winter is Coming...";
static const size_t NUM_MEMBERS = 8;
static const size_t SIGNER = 3;

static void usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " [--topic TEXT] [--signer N | --key HEX] [--randomize-padding]"
              << " [--metrics PATH] [--trace]\n";
}

int main(int argc, char** argv) {
    std::string topic = TOPIC;
    size_t signer = SIGNER;
    bool show_trace = false;
    std::string key_hex;
    Params prm;

    for (int i = 1; i < argc; i++) {
        if (!strcmp(argv[i], "--topic") && i + 1 < argc) {
            topic = argv[++i];
        } else if (!strcmp(argv[i], "--signer") && i + 1 < argc) {
            signer = (size_t)strtoull(argv[++i], nullptr, 10);
        } else if (!strcmp(argv[i], "--key") && i + 1 < argc) {
            key_hex = argv[++i];
        } else if (!strcmp(argv[i], "--randomize-padding")) {
            prm.randomize_padding = true;
        } else if (!strcmp(argv[i], "--metrics") && i + 1 < argc) {
            prm.metrics_path = argv[++i];
        } else if (!strcmp(argv[i], "--trace")) {
            show_trace = true;
        } else {
            usage(argv[0]);
            return 2;
        }
    }

    std::vector<PrivKey> keys;
    std::vector<PubKey> members;
    for (size_t i = 0; i < NUM_MEMBERS; i++) {
        keys.push_back(keygen_from_label("member", i));
        members.push_back(derive_pub_key(keys.back()));
    }

    // the only backend shipped publishes the trace, key included
    prm.allow_transparent_proofs = true;
    TraceProofBackend backend;

    AccessSet set(members, prm);
    std::cerr << "[warn] reference backend: signals reveal the signer's private key\n";
    std::cout << "[set] " << set.size() << " members, depth " << set.depth()
              << ", root " << digest_to_hex(set.root()) << "\n";
    for (size_t i = 0; i < members.size(); i++)
        std::cout << "[set]   " << i << ": " << members[i].to_hex() << "\n";

    NullifierRegistry registry;
    try {
        if (!key_hex.empty()) {
            PrivKey sk = priv_key_from_hex(key_hex);
            auto idx = set.index_of(derive_pub_key(sk));
            if (!idx) throw WitnessError(WitnessErrc::UNKNOWN_KEY, "--key");
            signer = *idx;
        }
        if (signer >= keys.size())
            throw WitnessError(WitnessErrc::INVALID_INDEX, "signer " + std::to_string(signer));

        Stopwatch sw;
        Signal sig = set.make_signal(keys[signer], topic, backend);
        std::cout << "[prove] member " << signer << " signaled in "
                  << (long)sw.elapsed_ms() << " ms\n"
                  << sig.to_string() << "\n";

        if (show_trace) {
            SemaphoreProver prover(set.depth(), prm);
            auto path = set.path_for(signer);
            auto trace = prover.build_trace(keys[signer], path, signer, rescue::hash_bytes(topic));
            std::cout << "[trace] rows 0..16, " << trace.length() << " x " << trace.width() << "\n";
            print_trace(std::cout, trace, 0, 16, 0, trace.width());
        }

        SignalStatus first = accept_signal(set, registry, topic, sig, backend);
        std::cout << "[verify] first signal: " << signal_status_name(first) << "\n";

        Signal again = set.make_signal(keys[signer], topic, backend);
        SignalStatus second = accept_signal(set, registry, topic, again, backend);
        std::cout << "[verify] second signal by the same member: " << signal_status_name(second) << "\n";

        Signal other = set.make_signal(keys[(signer + 1) % keys.size()], topic, backend);
        SignalStatus third = accept_signal(set, registry, topic, other, backend);
        std::cout << "[verify] signal by another member: " << signal_status_name(third) << "\n";

        auto bytes = sig.to_bytes();
        auto parsed = Signal::from_bytes(bytes.data(), bytes.size());
        if (!parsed || !set.verify_signal(topic, *parsed, backend)) {
            std::cerr << "serialized signal failed to verify\n";
            return 1;
        }

        if (first != SignalStatus::ACCEPTED || second != SignalStatus::REPLAYED ||
            third != SignalStatus::ACCEPTED)
            return 1;
    } catch (const WitnessError& e) {
        std::cerr << "witness error: " << e.what() << "\n";
        return 1;
    } catch (const ConstraintViolation& e) {
        std::cerr << "prover aborted: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
