#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <atomic>
#include <thread>
#include <vector>
#include "cas/responder.hpp"
#include "test_utils.hpp"

using namespace stubcas::cas;
using stubcas::hashing::Digest;
using stubcas::hashing::Fingerprint;
using stubcas::hashing::FingerprintError;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

class ResponderTest : public ::testing::Test {
protected:
  void SetUp() override {
    init_test_logging();
  }

  static BlobMap blobs_of(const std::vector<std::string>& contents) {
    BlobMap blobs;
    for (const auto& content : contents) {
      blobs[Fingerprint::of_bytes(content)] = content;
    }
    return blobs;
  }

  static ReadRequest read_request(const std::string& resource_name) {
    ReadRequest request;
    request.resource_name = resource_name;
    return request;
  }

  static std::vector<std::string> chunk_data(const std::vector<ReadResponse>& chunks) {
    std::vector<std::string> data;
    for (const auto& chunk : chunks) {
      data.push_back(chunk.data);
    }
    return data;
  }

  // Runs a call expected to fail and returns the raised error
  template <typename Call>
  static RpcError expect_rpc_error(Call call, StatusCode code) {
    try {
      call();
    } catch (const RpcError& e) {
      EXPECT_EQ(e.code(), code) << e.what();
      return e;
    }
    ADD_FAILURE() << "Expected RpcError with code " << code;
    return RpcError(StatusCode::OK, "");
  }

  static WireDigest wire_digest_of(const std::string& content) {
    return to_wire_digest(Digest::of_bytes(content));
  }
};

TEST_F(ResponderTest, RejectsZeroChunkSize) {
  EXPECT_THROW(Responder(0, BlobMap{}), std::invalid_argument);
}

TEST_F(ResponderTest, WriteThenReadHelloExample) {
  Responder responder(2, BlobMap{});
  const std::string hello = "hello";

  auto missing = expect_rpc_error([&] { responder.read(read_request(read_resource_name(hello))); },
                                  StatusCode::NOT_FOUND);
  EXPECT_EQ(std::string(missing.what()), "Did not find digest " + Fingerprint::of_bytes(hello).to_hex());

  WriteRequest request;
  request.resource_name = upload_resource_name(hello);
  request.write_offset = 0;
  request.finish_write = true;
  request.data = hello;
  WriteResponse response = responder.write({request});
  EXPECT_EQ(response.committed_size, 5);

  auto chunks = responder.read(read_request(read_resource_name(hello)));
  EXPECT_THAT(chunk_data(chunks), ElementsAre("he", "ll", "o"));
}

TEST_F(ResponderTest, ReadChunksCoverContent) {
  const std::string content = "0123456789abcdefghijklmnopqrstuvwxyz";
  for (int64_t chunk_size : {1, 3, 7, 10, 36, 100}) {
    Responder responder(chunk_size, blobs_of({content}));
    auto chunks = responder.read(read_request(read_resource_name(content)));

    const std::size_t size = static_cast<std::size_t>(chunk_size);
    EXPECT_EQ(chunks.size(), (content.size() + size - 1) / size) << "chunk size " << chunk_size;

    std::string joined;
    for (std::size_t i = 0; i < chunks.size(); ++i) {
      if (i + 1 < chunks.size()) {
        EXPECT_EQ(chunks[i].data.size(), size) << "chunk " << i << " is not full";
      }
      EXPECT_LE(chunks[i].data.size(), size);
      joined += chunks[i].data;
    }
    EXPECT_EQ(joined, content);
  }
}

TEST_F(ResponderTest, EmptyBlobReadsAsNoChunks) {
  Responder responder(1024, blobs_of({""}));
  auto chunks = responder.read(read_request(read_resource_name("")));
  EXPECT_TRUE(chunks.empty());
}

TEST_F(ResponderTest, ReadIgnoresDeclaredSize) {
  const std::string content = "European Burmese";
  Responder responder(1024, blobs_of({content}));
  auto chunks = responder.read(read_request("/blobs/" + Fingerprint::of_bytes(content).to_hex() + "/999"));
  EXPECT_THAT(chunk_data(chunks), ElementsAre(content));
}

TEST_F(ResponderTest, ReadRejectsMalformedResourceNames) {
  Responder responder(1024, BlobMap{});
  const std::string hex = Fingerprint::of_bytes("x").to_hex();

  for (const std::string& name : {std::string("blobs/") + hex + "/1",
                                  std::string("/blob/") + hex + "/1",
                                  std::string("/blobs/") + hex,
                                  std::string("")}) {
    auto error = expect_rpc_error([&] { responder.read(read_request(name)); }, StatusCode::INVALID_ARGUMENT);
    EXPECT_EQ(std::string(error.what()),
              "Bad resource name format " + name + " - want /blobs/some-sha256/size");
  }
}

TEST_F(ResponderTest, ReadRejectsBadDigest) {
  Responder responder(1024, BlobMap{});
  auto error = expect_rpc_error([&] { responder.read(read_request("/blobs/not-hex/1")); },
                                StatusCode::INVALID_ARGUMENT);
  EXPECT_THAT(error.what(), HasSubstr("Bad digest not-hex: "));
}

TEST_F(ResponderTest, ReadCounterCountsEveryCall) {
  const std::string content = "catnip";
  Responder responder(1024, blobs_of({content}));
  EXPECT_EQ(responder.read_request_count(), 0u);

  responder.read(read_request(read_resource_name(content)));
  EXPECT_EQ(responder.read_request_count(), 1u);

  expect_rpc_error([&] { responder.read(read_request("garbage")); }, StatusCode::INVALID_ARGUMENT);
  EXPECT_EQ(responder.read_request_count(), 2u);

  expect_rpc_error([&] { responder.read(read_request(read_resource_name("absent"))); },
                   StatusCode::NOT_FOUND);
  EXPECT_EQ(responder.read_request_count(), 3u);
}

TEST_F(ResponderTest, WriteInMultipleChunks) {
  const std::string content = "The quick brown fox jumps over the lazy dog";
  Responder responder(5, BlobMap{});

  auto response = responder.write(make_write_stream(upload_resource_name(content), content, 10));
  EXPECT_EQ(response.committed_size, static_cast<int64_t>(content.size()));
  EXPECT_THAT(responder.write_message_sizes(), ElementsAre(10u, 10u, 10u, 10u, 3u));

  auto blob = responder.get_blob(Fingerprint::of_bytes(content));
  ASSERT_TRUE(blob.has_value());
  EXPECT_EQ(*blob, content);

  std::string joined;
  for (const auto& chunk : responder.read(read_request(read_resource_name(content)))) {
    joined += chunk.data;
  }
  EXPECT_EQ(joined, content);
}

TEST_F(ResponderTest, WriteOverwritesExistingContent) {
  const std::string content = "Pug";
  const Fingerprint fingerprint = Fingerprint::of_bytes(content);
  BlobMap blobs;
  blobs[fingerprint] = "stale";
  Responder responder(1024, blobs);

  responder.write(make_write_stream(upload_resource_name(content), content, 1024));
  auto blob = responder.get_blob(fingerprint);
  ASSERT_TRUE(blob.has_value());
  EXPECT_EQ(*blob, content);
}

TEST_F(ResponderTest, WriteRejectsOffsetGap) {
  const std::string content = "abcdef";
  Responder responder(1024, BlobMap{});
  auto requests = make_write_stream(upload_resource_name(content), content, 2);
  requests[2].write_offset = 5;

  auto error = expect_rpc_error([&] { responder.write(requests); }, StatusCode::INVALID_ARGUMENT);
  EXPECT_EQ(std::string(error.what()), "Missing chunk. Expected next offset 4, got next offset: 5");
  EXPECT_TRUE(responder.blobs().empty());
}

TEST_F(ResponderTest, WriteRejectsReorderedChunks) {
  const std::string content = "abcdef";
  Responder responder(1024, BlobMap{});
  auto requests = make_write_stream(upload_resource_name(content), content, 2);
  std::swap(requests[1], requests[2]);

  expect_rpc_error([&] { responder.write(requests); }, StatusCode::INVALID_ARGUMENT);
  EXPECT_TRUE(responder.blobs().empty());
}

TEST_F(ResponderTest, WriteRejectsDuplicatedChunk) {
  const std::string content = "abcdef";
  Responder responder(1024, BlobMap{});
  auto requests = make_write_stream(upload_resource_name(content), content, 3);
  WriteRequest duplicate = requests[0];
  requests.insert(requests.begin() + 1, duplicate);

  expect_rpc_error([&] { responder.write(requests); }, StatusCode::INVALID_ARGUMENT);
  EXPECT_TRUE(responder.blobs().empty());
}

TEST_F(ResponderTest, WriteRejectsInconsistentResourceNames) {
  const std::string content = "abcdef";
  Responder responder(1024, BlobMap{});
  const std::string first = upload_resource_name(content, "first");
  const std::string second = upload_resource_name(content, "second");
  auto requests = make_write_stream(first, content, 3);
  requests[1].resource_name = second;

  auto error = expect_rpc_error([&] { responder.write(requests); }, StatusCode::INVALID_ARGUMENT);
  EXPECT_EQ(std::string(error.what()),
            "All resource names in stream must be the same. Got " + second + " but earlier saw " + first);
  EXPECT_TRUE(responder.blobs().empty());
}

TEST_F(ResponderTest, WriteRejectsEmptyStream) {
  Responder responder(1024, BlobMap{});
  auto error = expect_rpc_error([&] { responder.write({}); }, StatusCode::INVALID_ARGUMENT);
  EXPECT_EQ(std::string(error.what()), "Stream saw no messages");
}

TEST_F(ResponderTest, WriteRejectsMalformedUploadNames) {
  const std::string content = "abc";
  const std::string hex = Fingerprint::of_bytes(content).to_hex();
  Responder responder(1024, BlobMap{});

  for (const std::string& name : {std::string("instance/upload/u1/blobs/") + hex + "/3",
                                  std::string("instance/uploads/u1/blob/") + hex + "/3",
                                  std::string("instance/uploads/u1/blobs/") + hex}) {
    auto error = expect_rpc_error([&] { responder.write(make_write_stream(name, content, 1024)); },
                                  StatusCode::INVALID_ARGUMENT);
    EXPECT_EQ(std::string(error.what()), "Bad resource name: " + name);
  }

  auto bad_hex = expect_rpc_error(
    [&] { responder.write(make_write_stream("instance/uploads/u1/blobs/xyz/3", content, 1024)); },
    StatusCode::INVALID_ARGUMENT);
  EXPECT_THAT(bad_hex.what(), HasSubstr("Bad fingerprint in resource name: xyz: "));

  auto bad_size = expect_rpc_error(
    [&] { responder.write(make_write_stream("instance/uploads/u1/blobs/" + hex + "/-3", content, 1024)); },
    StatusCode::INVALID_ARGUMENT);
  EXPECT_THAT(bad_size.what(), HasSubstr("Bad size in resource name: -3: "));

  EXPECT_TRUE(responder.blobs().empty());
}

TEST_F(ResponderTest, WriteKeepsSlashesInSizeSegment) {
  const std::string content = "abc";
  const std::string name = "instance/uploads/u1/blobs/" + Fingerprint::of_bytes(content).to_hex() + "/3/extra";
  Responder responder(1024, BlobMap{});

  auto error = expect_rpc_error([&] { responder.write(make_write_stream(name, content, 1024)); },
                                StatusCode::INVALID_ARGUMENT);
  EXPECT_THAT(error.what(), HasSubstr("Bad size in resource name: 3/extra"));
}

TEST_F(ResponderTest, WriteRejectsSizeMismatch) {
  const std::string content = "abcdef";
  const std::string name = "instance/uploads/u1/blobs/" + Fingerprint::of_bytes(content).to_hex() + "/4";
  Responder responder(1024, BlobMap{});

  auto error = expect_rpc_error([&] { responder.write(make_write_stream(name, content, 2)); },
                                StatusCode::INVALID_ARGUMENT);
  EXPECT_EQ(std::string(error.what()), "Size was incorrect: resource name said size=4 but got 6");
  EXPECT_TRUE(responder.blobs().empty());
}

TEST_F(ResponderTest, WriteSizesRecordedUpToFailingChunk) {
  const std::string content = "abcdef";
  Responder responder(1024, BlobMap{});
  auto requests = make_write_stream(upload_resource_name(content), content, 2);
  requests[1].write_offset = 0;

  expect_rpc_error([&] { responder.write(requests); }, StatusCode::INVALID_ARGUMENT);
  EXPECT_THAT(responder.write_message_sizes(), ElementsAre(2u));

  auto mismatched = make_write_stream(upload_resource_name(content, "a"), content, 3);
  mismatched[1].resource_name = upload_resource_name(content, "b");
  expect_rpc_error([&] { responder.write(mismatched); }, StatusCode::INVALID_ARGUMENT);
  EXPECT_THAT(responder.write_message_sizes(), ElementsAre(2u, 3u));

  // Size mismatch is detected after the whole stream, every chunk is recorded
  const std::string name = "instance/uploads/u1/blobs/" + Fingerprint::of_bytes(content).to_hex() + "/4";
  expect_rpc_error([&] { responder.write(make_write_stream(name, content, 4)); }, StatusCode::INVALID_ARGUMENT);
  EXPECT_THAT(responder.write_message_sizes(), ElementsAre(2u, 3u, 4u, 2u));

  responder.write(make_write_stream(upload_resource_name("xyz"), "xyz", 1024));
  EXPECT_THAT(responder.write_message_sizes(), ElementsAre(2u, 3u, 4u, 2u, 3u));
}

TEST_F(ResponderTest, WriteAcceptsPlusSignedSize) {
  const std::string content = "hello";
  const std::string hex = Fingerprint::of_bytes(content).to_hex();
  Responder responder(1024, BlobMap{});

  auto response = responder.write(make_write_stream("instance/uploads/u1/blobs/" + hex + "/+5", content, 1024));
  EXPECT_EQ(response.committed_size, 5);
  auto blob = responder.get_blob(Fingerprint::of_bytes(content));
  ASSERT_TRUE(blob.has_value());
  EXPECT_EQ(*blob, content);

  for (const std::string& size : {std::string("+"), std::string("++5"), std::string("5+")}) {
    auto error = expect_rpc_error(
      [&] { responder.write(make_write_stream("instance/uploads/u1/blobs/" + hex + "/" + size, content, 1024)); },
      StatusCode::INVALID_ARGUMENT);
    EXPECT_EQ(std::string(error.what()), "Bad size in resource name: " + size + ": invalid digit");
  }
}

TEST_F(ResponderTest, FindMissingBlobsPreservesOrder) {
  Responder responder(1024, blobs_of({"A", "B"}));

  FindMissingBlobsRequest request;
  request.blob_digests = {wire_digest_of("A"), wire_digest_of("C"), wire_digest_of("B")};
  auto response = responder.find_missing_blobs(request);
  EXPECT_THAT(response.missing_blob_digests, ElementsAre(wire_digest_of("C")));

  request.blob_digests = {wire_digest_of("D"), wire_digest_of("A"), wire_digest_of("C")};
  response = responder.find_missing_blobs(request);
  EXPECT_THAT(response.missing_blob_digests, ElementsAre(wire_digest_of("D"), wire_digest_of("C")));

  EXPECT_EQ(responder.blobs().size(), 2u);
}

TEST_F(ResponderTest, FindMissingBlobsMalformedDigestEscapes) {
  Responder responder(1024, BlobMap{});
  FindMissingBlobsRequest request;
  request.blob_digests = {WireDigest{"zz", 1}};
  EXPECT_THROW(responder.find_missing_blobs(request), FingerprintError);
}

TEST_F(ResponderTest, AlwaysFailTakesPrecedenceOverNotFound) {
  const std::string content = "roland";
  Responder responder(-1, blobs_of({content}));
  EXPECT_TRUE(responder.should_always_fail());

  for (const std::string& name : {read_resource_name(content), read_resource_name("absent")}) {
    auto error = expect_rpc_error([&] { responder.read(read_request(name)); }, StatusCode::INTERNAL);
    EXPECT_EQ(std::string(error.what()), "StubCAS is configured to always fail");
  }
  EXPECT_EQ(responder.read_request_count(), 2u);

  // Structural validation still comes first
  expect_rpc_error([&] { responder.read(read_request("/nope")); }, StatusCode::INVALID_ARGUMENT);
}

TEST_F(ResponderTest, AlwaysFailOnWriteAfterValidation) {
  const std::string content = "abcdef";
  Responder responder(-1, BlobMap{});

  expect_rpc_error([&] { responder.write(make_write_stream(upload_resource_name(content), content, 2)); },
                   StatusCode::INTERNAL);

  auto requests = make_write_stream(upload_resource_name(content, "a"), content, 2);
  requests[1].resource_name = upload_resource_name(content, "b");
  expect_rpc_error([&] { responder.write(requests); }, StatusCode::INVALID_ARGUMENT);

  EXPECT_TRUE(responder.blobs().empty());
  // Three chunks of the valid stream, then the one before the name mismatch
  EXPECT_EQ(responder.write_message_sizes().size(), 4u);
}

TEST_F(ResponderTest, AlwaysFailOnFindMissingBlobs) {
  Responder responder(-1, BlobMap{});
  FindMissingBlobsRequest request;
  request.blob_digests = {wire_digest_of("A")};
  expect_rpc_error([&] { responder.find_missing_blobs(request); }, StatusCode::INTERNAL);
}

TEST_F(ResponderTest, UnimplementedMethods) {
  Responder responder(1024, BlobMap{});

  auto query = expect_rpc_error([&] { responder.query_write_status(QueryWriteStatusRequest{}); },
                                StatusCode::UNIMPLEMENTED);
  EXPECT_EQ(std::string(query.what()), "");
  expect_rpc_error([&] { responder.batch_update_blobs(BatchUpdateBlobsRequest{}); },
                   StatusCode::UNIMPLEMENTED);
  expect_rpc_error([&] { responder.get_tree(GetTreeRequest{}); }, StatusCode::UNIMPLEMENTED);

  BatchUpdateBlobsRequest batch;
  batch.requests.push_back({wire_digest_of("A"), "A"});
  expect_rpc_error([&] { responder.batch_update_blobs(batch); }, StatusCode::UNIMPLEMENTED);
  EXPECT_TRUE(responder.blobs().empty());
}

TEST_F(ResponderTest, ConcurrentReadsAndWrites) {
  Responder responder(4, BlobMap{});
  const int thread_count = 8;
  const int calls_per_thread = 25;
  std::atomic<int> failures{0};

  std::vector<std::thread> threads;
  for (int t = 0; t < thread_count; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < calls_per_thread; ++i) {
        const std::string content = "thread-" + std::to_string(t) + "-blob-" + std::to_string(i);
        try {
          responder.write(make_write_stream(upload_resource_name(content), content, 3));
          std::string joined;
          for (const auto& chunk : responder.read(read_request(read_resource_name(content)))) {
            joined += chunk.data;
          }
          if (joined != content) {
            ++failures;
          }
        } catch (const RpcError&) {
          ++failures;
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(failures.load(), 0);
  EXPECT_EQ(responder.read_request_count(), static_cast<std::size_t>(thread_count * calls_per_thread));
  EXPECT_EQ(responder.blobs().size(), static_cast<std::size_t>(thread_count * calls_per_thread));
}

TEST(SplitResourceNameTest, KeepsRemainderInLastPart) {
  EXPECT_THAT(split_resource_name("/blobs/abc/3", 4), ElementsAre("", "blobs", "abc", "3"));
  EXPECT_THAT(split_resource_name("/blobs/abc/3/4", 4), ElementsAre("", "blobs", "abc", "3/4"));
  EXPECT_THAT(split_resource_name("/blobs", 4), ElementsAre("", "blobs"));
  EXPECT_THAT(split_resource_name("", 4), ElementsAre(""));
}
