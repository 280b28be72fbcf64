#include "ScriptRunner.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <utility>

#include "MemoryError.hpp"
#include "VirtualMemory.hpp"
#include "WordFormat.hpp"

namespace vmem {

namespace {

// One script execution at a fixed word width.
template <std::size_t W>
class ScriptSession {
public:
    ScriptSession(const VMemConfig& cfg, VirtualMemory<W> mem, std::ostream& out, std::ostream& err)
        : cfg_(cfg), mem_(std::move(mem)), baseline_(mem_), out_(out), err_(err) {}

    std::size_t run(const std::vector<ScriptOp>& ops) {
        std::size_t failed = 0;
        for (std::size_t i = 0; i < ops.size(); ++i) {
            try {
                apply(ops[i]);
            } catch (const std::out_of_range& e) {
                ++failed;
                err_ << "[Script] op #" << i << " (" << to_string(ops[i].kind) << ") failed: " << e.what() << "\n";
            } catch (const std::invalid_argument& e) {
                ++failed;
                err_ << "[Script] op #" << i << " (" << to_string(ops[i].kind) << ") rejected: " << e.what() << "\n";
            }
        }
        out_ << "[Script] done: " << mem_.stored_words() << "/" << mem_.len() << " word(s) stored\n";
        return failed;
    }

private:
    static Word<W> to_word(const std::vector<std::uint8_t>& bytes) {
        if (bytes.size() != W) {
            throw std::invalid_argument("word needs " + std::to_string(W) + " byte(s), got " +
                                        std::to_string(bytes.size()));
        }
        Word<W> word{};
        std::copy(bytes.begin(), bytes.end(), word.begin());
        return word;
    }

    void apply(const ScriptOp& op) {
        switch (op.kind) {
            case ScriptOpKind::WriteWord: {
                mem_.write_word(to_word(op.bytes), op.addr);
                if (cfg_.verbose) out_ << "[Script] write_word " << format_address(op.addr) << " <- " << to_hex(op.bytes) << "\n";
                break;
            }
            case ScriptOpKind::ReadWord: {
                auto word = mem_.read_word(op.addr);
                out_ << "[Script] read_word " << format_address(op.addr) << " = "
                     << (word ? to_hex(*word) : std::string("(out of range)")) << "\n";
                break;
            }
            case ScriptOpKind::WriteAt: {
                mem_.write_at(op.bytes, op.addr);
                if (cfg_.verbose) out_ << "[Script] write_at " << format_address(op.addr) << " <- " << to_hex(op.bytes) << "\n";
                break;
            }
            case ScriptOpKind::ReadAt: {
                // nothing past the last word can be filled, so cap the buffer there
                if (op.size / W > mem_.len()) {
                    throw std::invalid_argument("read size " + std::to_string(op.size) + " exceeds " +
                                                std::to_string(mem_.len()) + " word(s)");
                }
                std::vector<std::uint8_t> buf(op.size, 0x00);
                mem_.read_at(buf, op.addr);
                out_ << "[Script] read_at " << format_address(op.addr) << " [" << op.size << "] = " << to_hex(buf) << "\n";
                break;
            }
            case ScriptOpKind::Snapshot: {
                baseline_ = mem_;
                out_ << "[Script] snapshot: " << baseline_.stored_words() << " word(s) stored\n";
                break;
            }
            case ScriptOpKind::Diff: {
                auto changes = VirtualMemory<W>::diff(baseline_, mem_);
                out_ << "[Script] diff: " << changes.size() << " changed word(s)\n";
                for (const auto& [addr, word] : changes) {
                    out_ << "  " << format_address(addr) << ": " << to_hex(word) << "\n";
                }
                break;
            }
            case ScriptOpKind::Patch: {
                Changeset<W> changes;
                for (const auto& [addr, bytes] : op.changes) changes[addr] = to_word(bytes);
                mem_.patch(changes);
                out_ << "[Script] patch: " << changes.size() << " word(s) applied\n";
                break;
            }
            case ScriptOpKind::Chunks: {
                std::size_t size = op.size != 0 ? op.size : cfg_.chunk_size;
                auto cursor = mem_.chunks_adjacent_content(size);
                while (auto chunk = cursor.next()) {
                    std::vector<std::uint8_t> bytes;
                    bytes.reserve(chunk->size() * W);
                    for (const auto& entry : *chunk) {
                        bytes.insert(bytes.end(), entry.second->begin(), entry.second->end());
                    }
                    out_ << "[Script] chunk " << format_address(chunk->front().first) << " [" << chunk->size()
                         << "]: " << to_hex(bytes) << "\n";
                }
                break;
            }
            case ScriptOpKind::Fill: {
                Word<W> fill = to_word(op.bytes);
                for (auto& word : mem_.words_mut()) word = fill;
                out_ << "[Script] fill: " << mem_.stored_words() << " word(s) materialized\n";
                break;
            }
            case ScriptOpKind::Dump: {
                out_ << "[Script] dump: " << mem_.stored_words() << " stored word(s)\n";
                for (const auto& [addr, word] : mem_.content()) {
                    out_ << "  " << format_address(addr) << ": " << to_hex(word) << "\n";
                }
                break;
            }
        }
    }

    const VMemConfig& cfg_;
    VirtualMemory<W> mem_;
    VirtualMemory<W> baseline_;
    std::ostream& out_;
    std::ostream& err_;
};

} // namespace

std::vector<std::uint8_t> load_image(const std::string& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        throw std::runtime_error("Cannot open image: " + path);
    }
    return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
}

template <std::size_t W>
std::size_t ScriptRunner::run_width(const Script& script) {
    const VMemConfig& cfg = script.config;
    if (cfg.image_path.empty()) {
        ScriptSession<W> session(cfg, VirtualMemory<W>(cfg.length), out_, err_);
        return session.run(script.ops);
    }
    auto image = load_image(cfg.image_path);
    auto mem = VirtualMemory<W>::from_bytes(image);
    out_ << "[Script] image " << cfg.image_path << ": " << image.size() << " byte(s), "
         << mem.len() << " word(s), " << mem.stored_words() << " non-zero\n";
    ScriptSession<W> session(cfg, std::move(mem), out_, err_);
    return session.run(script.ops);
}

std::size_t ScriptRunner::run(const Script& script) {
    validate_config(script.config);
    switch (script.config.width) {
        case 1: return run_width<1>(script);
        case 2: return run_width<2>(script);
        case 4: return run_width<4>(script);
        case 8: return run_width<8>(script);
        default: break;
    }
    throw std::invalid_argument("Unsupported word width " + std::to_string(script.config.width));
}

} // namespace vmem
