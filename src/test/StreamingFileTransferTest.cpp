#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>

#include <spdlog/sinks/base_sink.h>

#include "application/StatusChannel.hpp"
#include "application/StreamingFileTransfer.hpp"
#include "domain/CancellationToken.hpp"
#include "domain/ExtensionUtils.hpp"
#include "infrastructure/DestinationWriter.hpp"
#include "TestSupport.hpp"

using namespace fileextractor;
using application::StatusChannel;
using application::StreamingFileTransfer;
using application::TransferStatus;
using infrastructure::DestinationWriter;

namespace fs = std::filesystem;

namespace {

// Cancels the token on the first chunk copied for the watched file.
class CancelOnChunkSink : public spdlog::sinks::base_sink<std::mutex> {
public:
    CancelOnChunkSink(domain::CancellationToken& token, std::string fileName)
        : m_token(token), m_fileName(std::move(fileName)) {}

    std::size_t chunksSeen() const { return m_chunks; }

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override {
        std::string text(msg.payload.data(), msg.payload.size());
        if (text.find("bytes copied") != std::string::npos && text.find(m_fileName) != std::string::npos) {
            ++m_chunks;
            m_token.cancel();
        }
    }
    void flush_() override {}

private:
    domain::CancellationToken& m_token;
    std::string m_fileName;
    std::size_t m_chunks = 0;
};

domain::FileCandidate Candidate(const fs::path& root, const std::string& relative) {
    domain::FileCandidate candidate;
    candidate.path = root / relative;
    candidate.relativePath = relative;
    std::error_code ec;
    candidate.sizeBytes = fs::file_size(candidate.path, ec);
    candidate.extension = domain::CanonicalExtension(candidate.path);
    return candidate;
}

void TestWriterRollback(const fs::path& dir) {
    DestinationWriter writer(dir / "nested" / "out.txt");
    writer.open();
    assert(writer.write("abc"));
    const auto mark = writer.position();
    assert(mark == 3);
    assert(writer.write("defgh"));
    assert(writer.rollbackTo(mark));
    assert(writer.position() == 3);
    assert(writer.write("x"));
    assert(!writer.rollbackTo(100));
    assert(writer.close());
    assert(test::ReadFile(dir / "nested" / "out.txt") == "abcx");
    std::cout << "[PASS] DestinationWriter truncates back to a mark." << std::endl;
}

void TestSuccessfulTransfer(const fs::path& root, const fs::path& dir) {
    const std::string content = "h\xC3\xA9llo w\xC3\xB6rld \xE2\x82\xAC \xF0\x9F\x98\x80 end";
    test::WriteFile(root / "sub" / "utf8.txt", content);

    auto request = test::MakeRequest(root, dir / "ok.txt");
    request.chunkSize = 1; // every multi-byte sequence straddles chunks
    StatusChannel channel(16);
    domain::CancellationToken token;
    StreamingFileTransfer transfer(request, channel, token);

    DestinationWriter writer(request.outputPath);
    writer.open();
    auto outcome = transfer.transfer(Candidate(root, "sub/utf8.txt"), writer);
    assert(outcome.ok());
    assert(writer.close());

    const std::string expected = test::Block("sub/utf8.txt", content);
    assert(test::ReadFile(request.outputPath) == expected);
    assert(outcome.bytesWritten == expected.size());
    assert(channel.size() == 0);
    std::cout << "[PASS] Content streams through in chunks with a header and separator." << std::endl;
}

void TestDecodeErrorRollsBack(const fs::path& root, const fs::path& dir) {
    test::WriteFile(root / "good.txt", "good");
    test::WriteFile(root / "bad.txt", std::string("valid prefix that spans chunks \xFF tail"));
    test::WriteFile(root / "cut.txt", std::string("ends mid sequence \xE2\x82"));

    auto request = test::MakeRequest(root, dir / "decode.txt");
    request.chunkSize = 4;
    StatusChannel channel(16);
    domain::CancellationToken token;
    StreamingFileTransfer transfer(request, channel, token);

    DestinationWriter writer(request.outputPath);
    writer.open();
    assert(transfer.transfer(Candidate(root, "good.txt"), writer).ok());

    auto bad = transfer.transfer(Candidate(root, "bad.txt"), writer);
    assert(bad.status == TransferStatus::DecodeError);
    assert(!bad.destinationFailure);
    assert(bad.message.find("Cannot decode file") != std::string::npos);
    assert(bad.message.find("byte 31") != std::string::npos);

    auto cut = transfer.transfer(Candidate(root, "cut.txt"), writer);
    assert(cut.status == TransferStatus::DecodeError);

    assert(writer.close());
    assert(test::ReadFile(request.outputPath) == test::Block("good.txt", "good"));
    std::cout << "[PASS] Invalid UTF-8 leaves no partial block behind." << std::endl;
}

void TestMissingFile(const fs::path& root, const fs::path& dir) {
    auto request = test::MakeRequest(root, dir / "missing.txt");
    StatusChannel channel(4);
    domain::CancellationToken token;
    StreamingFileTransfer transfer(request, channel, token);

    DestinationWriter writer(request.outputPath);
    writer.open();
    domain::FileCandidate ghost;
    ghost.path = root / "gone.txt";
    ghost.relativePath = "gone.txt";
    ghost.extension = ".txt";
    auto outcome = transfer.transfer(ghost, writer);
    assert(outcome.status == TransferStatus::IOError);
    assert(!outcome.destinationFailure);
    assert(writer.position() == 0);
    std::cout << "[PASS] A vanished file is an IOError for that file only." << std::endl;
}

void TestLargeFileWarning(const fs::path& root, const fs::path& dir) {
    test::WriteFile(root / "large.txt", std::string(2048, 'x'));

    auto request = test::MakeRequest(root, dir / "large_out.txt");
    request.sizeWarningThreshold = 1024;
    StatusChannel channel(4);
    domain::CancellationToken token;
    std::ostringstream logLines;
    StreamingFileTransfer transfer(request, channel, token, test::MakeCapturingLogger(logLines));

    DestinationWriter writer(request.outputPath);
    writer.open();
    assert(transfer.transfer(Candidate(root, "large.txt"), writer).ok());

    auto messages = channel.drain();
    auto logs = test::Collect<domain::LogMessage>(messages);
    assert(logs.size() == 1);
    assert(logs[0].level == domain::LogLevel::Warning);
    assert(logs[0].text.find("large.txt") != std::string::npos);
    assert(logLines.str().find("beyond configured threshold") != std::string::npos);
    std::cout << "[PASS] Files over the threshold warn but are still written." << std::endl;
}

void TestCancelledBeforeStart(const fs::path& root, const fs::path& dir) {
    test::WriteFile(root / "c.txt", "content");
    auto request = test::MakeRequest(root, dir / "cancel.txt");
    StatusChannel channel(4);
    domain::CancellationToken token;
    token.cancel();
    StreamingFileTransfer transfer(request, channel, token);

    DestinationWriter writer(request.outputPath);
    writer.open();
    auto outcome = transfer.transfer(Candidate(root, "c.txt"), writer);
    assert(outcome.status == TransferStatus::Cancelled);
    assert(writer.close());
    assert(test::ReadFile(request.outputPath).empty());
    std::cout << "[PASS] A cancelled token writes nothing." << std::endl;
}

void TestCancelledMidFile(const fs::path& root, const fs::path& dir) {
    test::WriteFile(root / "first.txt", "first");
    test::WriteFile(root / "long.txt", std::string(64, 'l'));

    auto request = test::MakeRequest(root, dir / "midfile.txt");
    request.chunkSize = 8;
    StatusChannel channel(4);
    domain::CancellationToken token;
    auto sink = std::make_shared<CancelOnChunkSink>(token, "long.txt");
    auto logger = std::make_shared<spdlog::logger>("midfile", sink);
    logger->set_level(spdlog::level::trace);
    StreamingFileTransfer transfer(request, channel, token, logger);

    DestinationWriter writer(request.outputPath);
    writer.open();
    assert(transfer.transfer(Candidate(root, "first.txt"), writer).ok());
    const auto mark = writer.position();

    auto outcome = transfer.transfer(Candidate(root, "long.txt"), writer);
    assert(outcome.status == TransferStatus::Cancelled);
    assert(!outcome.destinationFailure);
    assert(sink->chunksSeen() == 1);
    assert(writer.position() == mark);
    assert(writer.close());
    assert(test::ReadFile(request.outputPath) == test::Block("first.txt", "first"));
    std::cout << "[PASS] Cancelling after a chunk removes the partial block." << std::endl;
}

void TestContentDigest(const fs::path& root, const fs::path& dir) {
    test::WriteFile(root / "abc.txt", "abc");
    test::WriteFile(root / "empty.txt", "");

    auto request = test::MakeRequest(root, dir / "digest.txt");
    request.chunkSize = 1;
    StatusChannel channel(4);
    domain::CancellationToken token;
    StreamingFileTransfer transfer(request, channel, token);

    DestinationWriter writer(request.outputPath);
    writer.open();
    auto abc = transfer.transfer(Candidate(root, "abc.txt"), writer);
    auto empty = transfer.transfer(Candidate(root, "empty.txt"), writer);
    assert(writer.close());

    assert(abc.ok());
    assert(abc.sha256 == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    assert(empty.ok());
    assert(empty.sha256 == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    std::cout << "[PASS] Each transfer reports the SHA-256 of the file content." << std::endl;
}

void TestDestinationFailure(const fs::path& root) {
    if (!fs::exists("/dev/full")) {
        std::cout << "[SKIP] /dev/full not available." << std::endl;
        return;
    }
    test::WriteFile(root / "payload.txt", std::string(64 * 1024, 'p'));
    auto request = test::MakeRequest(root, "/dev/full");
    StatusChannel channel(4);
    domain::CancellationToken token;
    StreamingFileTransfer transfer(request, channel, token);

    DestinationWriter writer(request.outputPath);
    writer.open();
    auto outcome = transfer.transfer(Candidate(root, "payload.txt"), writer);
    assert(!outcome.ok());
    assert(outcome.destinationFailure);
    std::cout << "[PASS] A failing output stream is flagged as a destination failure." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting StreamingFileTransfer Test..." << std::endl;
    test::ScratchDir scratch("fe_transfer");
    const fs::path root = scratch.path() / "src";
    const fs::path out = scratch.path() / "out";
    fs::create_directories(root);
    fs::create_directories(out);

    TestWriterRollback(out);
    TestSuccessfulTransfer(root, out);
    TestDecodeErrorRollsBack(root, out);
    TestMissingFile(root, out);
    TestLargeFileWarning(root, out);
    TestCancelledBeforeStart(root, out);
    TestCancelledMidFile(root, out);
    TestContentDigest(root, out);
    TestDestinationFailure(root);

    std::cout << "[Test] All StreamingFileTransfer tests passed." << std::endl;
    return 0;
}
