#include "request_handler.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <sys/stat.h>
#include <unistd.h>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace nsf;
using nsf::test::ParsedResponse;
using nsf::test::TempDir;

namespace {

class RequestHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ServerConfig cfg;
        cfg.root_dir = dir_.path();
        handler_ = std::make_unique<RequestHandler>(cfg);
    }

    ParsedResponse get(const std::string& path, const std::string& method = "GET") {
        HttpRequest req;
        req.method = method;
        req.target = path;
        req.path = path;
        req.version = "HTTP/1.1";

        std::string raw;
        last_status_ = handler_->handle(req, [&raw](const char* data, size_t size) {
            raw.append(data, size);
            return true;
        });
        return test::parse_response(raw);
    }

    TempDir dir_;
    std::unique_ptr<RequestHandler> handler_;
    int last_status_ = 0;
};

} // namespace

TEST_F(RequestHandlerTest, MissingPathIs404) {
    auto r = get("/does-not-exist.txt");
    EXPECT_EQ(r.status, 404);
    EXPECT_EQ(last_status_, 404);
    EXPECT_EQ(r.body, "404 Not Found\n");
}

TEST_F(RequestHandlerTest, FileDownloadHasExactLength) {
    std::string content(200000, '\0');
    for (size_t i = 0; i < content.size(); i++) content[i] = static_cast<char>(i * 7);
    dir_.write_file("data/blob.bin", content);

    auto r = get("/data/blob.bin");
    ASSERT_EQ(r.status, 200);
    EXPECT_EQ(r.header("Content-Length"), std::to_string(content.size()));
    EXPECT_EQ(r.header("Content-Type"), "application/octet-stream");
    EXPECT_EQ(r.header("Content-Disposition"),
              "attachment; filename=\"blob.bin\"; filename*=UTF-8''blob.bin");
    EXPECT_EQ(r.body.size(), content.size());
    EXPECT_EQ(r.body, content);
}

TEST_F(RequestHandlerTest, EmptyFileDownload) {
    dir_.write_file("empty", "");
    auto r = get("/empty");
    ASSERT_EQ(r.status, 200);
    EXPECT_EQ(r.header("Content-Length"), "0");
    EXPECT_TRUE(r.body.empty());
}

TEST_F(RequestHandlerTest, HeadSendsHeadersOnly) {
    dir_.write_file("f.txt", "hello");
    auto r = get("/f.txt", "HEAD");
    ASSERT_EQ(r.status, 200);
    EXPECT_EQ(r.header("Content-Length"), "5");
    EXPECT_TRUE(r.body.empty());
}

TEST_F(RequestHandlerTest, OtherMethodsRejected) {
    auto r = get("/", "POST");
    EXPECT_EQ(r.status, 405);
    EXPECT_EQ(r.header("Allow"), "GET, HEAD");
}

TEST_F(RequestHandlerTest, RootListingHasChildrenAndNoParent) {
    dir_.write_file("a.txt", "a");
    dir_.write_file("sub/inner.txt", "i");

    auto r = get("/");
    ASSERT_EQ(r.status, 200);
    EXPECT_EQ(r.header("Content-Type"), "text/html; charset=utf-8");
    EXPECT_EQ(r.header("Content-Length"), std::to_string(r.body.size()));
    EXPECT_NE(r.body.find("href=\"/a.txt\""), std::string::npos);
    EXPECT_NE(r.body.find("href=\"/sub/\""), std::string::npos);
    EXPECT_EQ(r.body.find("inner.txt"), std::string::npos);
    EXPECT_EQ(test::count_occurrences(r.body, "Parent Directory"), 0u);
    EXPECT_EQ(test::count_occurrences(r.body, "<li>"), 2u);
}

TEST_F(RequestHandlerTest, SubdirectoryListingHasOneParentLink) {
    dir_.write_file("sub/inner.txt", "i");
    dir_.make_dir("sub/deeper");

    auto r = get("/sub/");
    ASSERT_EQ(r.status, 200);
    EXPECT_EQ(test::count_occurrences(r.body, "Parent Directory"), 1u);
    EXPECT_NE(r.body.find("href=\"/sub/inner.txt\""), std::string::npos);
    EXPECT_NE(r.body.find("href=\"/sub/deeper/\""), std::string::npos);
    EXPECT_EQ(test::count_occurrences(r.body, "<li>"), 3u);
}

TEST_F(RequestHandlerTest, HostileFileNameIsEscaped) {
    dir_.write_file("<script>.txt", "x");
    auto r = get("/");
    ASSERT_EQ(r.status, 200);
    EXPECT_EQ(r.body.find("<script>"), std::string::npos);
    EXPECT_NE(r.body.find("&lt;script&gt;.txt"), std::string::npos);
    EXPECT_NE(r.body.find("href=\"/%3Cscript%3E.txt\""), std::string::npos);

    auto file = get("/<script>.txt");
    EXPECT_EQ(file.status, 200);
    EXPECT_EQ(file.body, "x");
}

TEST_F(RequestHandlerTest, TraversalNeverLeavesRoot) {
    TempDir outside;
    outside.write_file("secret.txt", "top secret");
    std::string escape = "/../" + std::filesystem::path(outside.path()).filename().string() +
                         "/secret.txt";

    for (const std::string& path : {escape, std::string("/../../../../etc/passwd"),
                                    std::string("/a/../../etc/passwd")}) {
        auto r = get(path);
        EXPECT_NE(r.status, 200) << path;
        EXPECT_EQ(r.body.find("top secret"), std::string::npos) << path;
    }
}

TEST_F(RequestHandlerTest, TraversalCollapsesOntoRootContent) {
    dir_.write_file("etc/passwd", "inside root");
    auto r = get("/../../etc/passwd");
    ASSERT_EQ(r.status, 200);
    EXPECT_EQ(r.body, "inside root");
}

TEST_F(RequestHandlerTest, NulByteIsBadRequest) {
    std::string path = "/a";
    path += '\0';
    auto r = get(path);
    EXPECT_EQ(r.status, 400);
}

TEST_F(RequestHandlerTest, FifoIsRefused) {
    std::string fifo = dir_.path() + "/pipe";
    ASSERT_EQ(mkfifo(fifo.c_str(), 0600), 0);
    auto r = get("/pipe");
    EXPECT_EQ(r.status, 403);
}

TEST(RequestHandlerListing, DirectoryReadFailureIs403) {
    TempDir dir;
    dir.make_dir("shared");
    dir.write_file("shared/secret.txt", "s");
    ServerConfig cfg;
    cfg.root_dir = dir.path();

    std::string asked_for;
    RequestHandler handler(cfg, [&asked_for](const std::string& path, std::error_code& ec) {
        asked_for = path;
        ec = std::make_error_code(std::errc::permission_denied);
        return std::vector<DirectoryChild>{};
    });

    HttpRequest req;
    req.method = "GET";
    req.target = req.path = "/shared";
    req.version = "HTTP/1.1";
    std::string raw;
    int status = handler.handle(req, [&raw](const char* data, size_t size) {
        raw.append(data, size);
        return true;
    });

    auto r = test::parse_response(raw);
    EXPECT_EQ(status, 403);
    EXPECT_EQ(r.status, 403);
    EXPECT_EQ(r.body, "403 Forbidden\n");
    EXPECT_EQ(asked_for, dir.path() + "/shared");
}

TEST_F(RequestHandlerTest, ConcurrentDownloadsAreIndependent) {
    constexpr int kFiles = 8;
    std::vector<std::string> contents;
    for (int i = 0; i < kFiles; i++) {
        contents.push_back(std::string(50000 + i * 1000, static_cast<char>('a' + i)));
        dir_.write_file("f" + std::to_string(i), contents.back());
    }

    std::vector<std::string> raw(kFiles);
    std::vector<std::thread> threads;
    for (int i = 0; i < kFiles; i++) {
        threads.emplace_back([this, i, &raw]() {
            HttpRequest req;
            req.method = "GET";
            req.path = "/f" + std::to_string(i);
            handler_->handle(req, [&raw, i](const char* data, size_t size) {
                raw[i].append(data, size);
                return true;
            });
        });
    }
    for (auto& t : threads) t.join();

    for (int i = 0; i < kFiles; i++) {
        auto r = test::parse_response(raw[i]);
        ASSERT_EQ(r.status, 200) << i;
        EXPECT_EQ(r.header("Content-Length"), std::to_string(contents[i].size()));
        EXPECT_EQ(r.body, contents[i]) << "file " << i;
    }
}

TEST_F(RequestHandlerTest, WriteFailureStopsStreaming) {
    dir_.write_file("big.bin", std::string(1 << 20, 'z'));
    HttpRequest req;
    req.method = "GET";
    req.path = "/big.bin";

    int writes = 0;
    int status = handler_->handle(req, [&writes](const char*, size_t) {
        return ++writes < 3;
    });
    EXPECT_EQ(status, 200);
    EXPECT_EQ(writes, 3);
}
