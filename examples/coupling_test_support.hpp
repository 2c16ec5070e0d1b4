#pragma once

/**
 * @file coupling_test_support.hpp
 * @brief Test doubles for the coupling tests
 *
 * RecordingTransport plays the structural solver: scripted answers per
 * value name, failure injection, and a log of every call.
 * PartitionedCommunicator plays the coordinating rank of a local group
 * whose other partitions contribute fixed values to the reductions.
 */

#include <fsilink/core/core.hpp>
#include <fsilink/coupling/transport.hpp>
#include <fsilink/coupling/field_mapper.hpp>

#include <algorithm>
#include <deque>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace fsl {
namespace testing {

// ============================================================================
// Recording Transport
// ============================================================================

class RecordingTransport : public coupling::TransportChannel {
public:
    struct Call {
        std::string op;          ///< send_ints, send_reals, receive_ints, ...
        int peer = -1;
        int iteration = 0;
        std::string name;
        std::vector<Real> values;
    };

    // Scripting

    void script_real(const std::string& name, Real value) { reals_[name].push_back({value}); }
    void script_int(const std::string& name, Int value) { ints_[name].push_back({value}); }
    void script_field(const std::string& name, std::vector<Real> values) {
        fields_[name].push_back(std::move(values));
    }

    /// Every call from the n-th one on (0-based) fails with the given status
    void fail_from_call(std::size_t n, int status = coupling::transport_status::Disconnected) {
        fail_from_ = n;
        fail_status_ = status;
    }

    /// Calls touching this name fail
    void fail_on(const std::string& name, int status = coupling::transport_status::Disconnected) {
        failing_names_[name] = status;
    }

    // Inspection

    const std::vector<Call>& calls() const { return calls_; }
    std::size_t n_calls() const { return calls_.size(); }

    std::size_t count(const std::string& op) const {
        return static_cast<std::size_t>(std::count_if(calls_.begin(), calls_.end(),
            [&](const Call& c) { return c.op == op; }));
    }

    std::size_t count_name(const std::string& name) const {
        return static_cast<std::size_t>(std::count_if(calls_.begin(), calls_.end(),
            [&](const Call& c) { return c.name == name; }));
    }

    /// Last call carrying this name, nullptr if none
    const Call* last(const std::string& name) const {
        for (auto it = calls_.rbegin(); it != calls_.rend(); ++it) {
            if (it->name == name) return &*it;
        }
        return nullptr;
    }

    // TransportChannel

    int send_ints(int peer, int iteration, const std::string& name,
                  ConstSpan<Int> values) override {
        record("send_ints", peer, iteration, name,
               std::vector<Real>(values.begin(), values.end()));
        return outcome(name, static_cast<int>(values.size()));
    }

    int send_reals(int peer, int iteration, const std::string& name,
                   ConstSpan<Real> values) override {
        record("send_reals", peer, iteration, name,
               std::vector<Real>(values.begin(), values.end()));
        return outcome(name, static_cast<int>(values.size()));
    }

    int receive_ints(int peer, int iteration, const std::string& name,
                     Span<Int> values) override {
        record("receive_ints", peer, iteration, name, {});
        const int status = outcome(name, 0);
        if (coupling::transport_status::failed(status)) return status;
        return deliver(ints_, name, values, false);
    }

    int receive_reals(int peer, int iteration, const std::string& name,
                      Span<Real> values) override {
        record("receive_reals", peer, iteration, name, {});
        const int status = outcome(name, 0);
        if (coupling::transport_status::failed(status)) return status;
        return deliver(reals_, name, values, false);
    }

    int send_field(int peer, const std::string& name, ConstSpan<Real> values) override {
        record("send_field", peer, 0, name, std::vector<Real>(values.begin(), values.end()));
        return outcome(name, static_cast<int>(values.size()));
    }

    int receive_field(int peer, const std::string& name, Span<Real> values) override {
        record("receive_field", peer, 0, name, {});
        const int status = outcome(name, 0);
        if (coupling::transport_status::failed(status)) return status;
        return deliver(fields_, name, values, true);
    }

    void close(int peer) override {
        record("close", peer, -1, "", {});
    }

private:
    void record(const char* op, int peer, int iteration, const std::string& name,
                std::vector<Real> values) {
        calls_.push_back(Call{op, peer, iteration, name, std::move(values)});
    }

    int outcome(const std::string& name, int count) const {
        if (calls_.size() > fail_from_) return fail_status_;
        auto it = failing_names_.find(name);
        if (it != failing_names_.end()) return it->second;
        return count;
    }

    /// Pops the next scripted value; the last one stays for later receives
    template<typename T, typename U>
    static int deliver(std::map<std::string, std::deque<std::vector<U>>>& script,
                       const std::string& name, Span<T> out, bool exact) {
        auto it = script.find(name);
        if (it == script.end() || it->second.empty()) {
            return coupling::transport_status::ProtocolError;
        }
        const std::vector<U>& values = it->second.front();
        if (values.size() > out.size() || (exact && values.size() != out.size())) {
            return coupling::transport_status::ProtocolError;
        }
        std::copy(values.begin(), values.end(), out.begin());
        const int n = static_cast<int>(values.size());
        if (it->second.size() > 1) it->second.pop_front();
        return n;
    }

    std::map<std::string, std::deque<std::vector<Real>>> reals_;
    std::map<std::string, std::deque<std::vector<Int>>> ints_;
    std::map<std::string, std::deque<std::vector<Real>>> fields_;

    std::map<std::string, int> failing_names_;
    std::size_t fail_from_ = static_cast<std::size_t>(-1);
    int fail_status_ = coupling::transport_status::Disconnected;

    std::vector<Call> calls_;
};

// ============================================================================
// Partitioned Communicator
// ============================================================================

/**
 * @brief Coordinating rank of a simulated local group
 *
 * Reductions add the configured contributions of the remote partitions.
 * Broadcasts from rank 0 leave the buffer as is.
 */
class PartitionedCommunicator : public Communicator {
public:
    explicit PartitionedCommunicator(int size = 1) : size_(size) {}

    void set_remote_reals(std::vector<Real> contribution) { remote_reals_ = std::move(contribution); }
    void set_remote_counts(std::vector<Int64> contribution) { remote_counts_ = std::move(contribution); }

    int rank() const override { return 0; }
    int size() const override { return size_; }

    void allreduce_sum(const Real* sendbuf, Real* recvbuf, int count) override {
        ++n_reductions;
        for (int i = 0; i < count; ++i) {
            recvbuf[i] = sendbuf[i] + (i < static_cast<int>(remote_reals_.size()) ? remote_reals_[i] : 0.0);
        }
    }

    void allreduce_sum(const Int64* sendbuf, Int64* recvbuf, int count) override {
        ++n_reductions;
        for (int i = 0; i < count; ++i) {
            recvbuf[i] = sendbuf[i] + (i < static_cast<int>(remote_counts_.size()) ? remote_counts_[i] : 0);
        }
    }

    void allreduce_min(const Int* sendbuf, Int* recvbuf, int count) override {
        ++n_reductions;
        std::copy(sendbuf, sendbuf + count, recvbuf);
    }

    void broadcast(Real*, int, int) override { ++n_broadcasts; }
    void broadcast(Int*, int, int) override { ++n_broadcasts; }

    void barrier() override {}

    int n_reductions = 0;
    int n_broadcasts = 0;

private:
    int size_;
    std::vector<Real> remote_reals_;
    std::vector<Int64> remote_counts_;
};

// ============================================================================
// Geometry
// ============================================================================

/**
 * @brief Strip of n quadrilateral boundary faces, all coupled
 *
 * Face f has vertices (f, f+1, n+1+f+1, n+1+f), i.e. 2(n+1) vertices.
 */
inline coupling::SurfaceFieldMapper make_strip_mapper(Index n_faces) {
    std::vector<Index> index(n_faces + 1);
    std::vector<Index> ids;
    for (Index f = 0; f < n_faces; ++f) {
        index[f] = ids.size();
        ids.push_back(f);
        ids.push_back(f + 1);
        ids.push_back(n_faces + 1 + f + 1);
        ids.push_back(n_faces + 1 + f);
    }
    index[n_faces] = ids.size();

    std::vector<Index> coupled(n_faces);
    for (Index f = 0; f < n_faces; ++f) coupled[f] = f;

    return coupling::SurfaceFieldMapper(std::move(coupled), index, ids);
}

} // namespace testing
} // namespace fsl
