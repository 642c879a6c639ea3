#include "trackmap/s3_store.hpp"
#include "trackmap/errors.hpp"

#include <aws/core/Aws.h>
#include <aws/core/auth/AWSCredentials.h>
#include <aws/core/http/HttpResponse.h>
#include <aws/core/utils/logging/LogLevel.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/model/DeleteObjectRequest.h>
#include <aws/s3/model/GetObjectRequest.h>
#include <aws/s3/model/HeadObjectRequest.h>
#include <aws/s3/model/ListObjectsV2Request.h>
#include <aws/s3/model/PutObjectRequest.h>
#include <spdlog/spdlog.h>

#include <mutex>
#include <sstream>
#include <stdexcept>

namespace trackmap {

namespace {

// "/a/b" -> "a/b"
std::string ObjectKey(const std::string& path) {
    if (path.empty() || path.front() != '/') {
        throw std::invalid_argument("path must start with '/': " + path);
    }
    return path.substr(1);
}

// Object key prefix under which the children of dir live.
std::string ChildPrefix(const std::string& dir) {
    std::string key = ObjectKey(dir);
    return key.empty() ? key : key + "/";
}

bool IsNotFound(Aws::Http::HttpResponseCode code) {
    return code == Aws::Http::HttpResponseCode::NOT_FOUND;
}

template <typename Error>
[[noreturn]] void ThrowUnavailable(const char* op, const std::string& path, const Error& error) {
    spdlog::warn("S3 {} failed for {}: {} ({})", op, path,
                 error.GetMessage().c_str(), static_cast<int>(error.GetResponseCode()));
    throw StoreUnavailableError(std::string(op) + ": " + error.GetMessage().c_str(), path);
}

// InitAPI/ShutdownAPI are process-wide; the SDK stays up while any store is alive.
std::mutex sdk_mutex;
int sdk_users = 0;
Aws::SDKOptions sdk_options;

void AcquireSdk() {
    std::lock_guard<std::mutex> lock(sdk_mutex);
    if (sdk_users++ == 0) {
        sdk_options.loggingOptions.logLevel = Aws::Utils::Logging::LogLevel::Fatal;
        Aws::InitAPI(sdk_options);
    }
}

void ReleaseSdk() {
    std::lock_guard<std::mutex> lock(sdk_mutex);
    if (--sdk_users == 0) {
        Aws::ShutdownAPI(sdk_options);
    }
}

} // namespace

// PIMPL for hiding AWS SDK headers
struct S3CoordinationStore::S3StoreImpl {
    std::unique_ptr<Aws::S3::S3Client> s3;
    std::string bucket;

    void Put(const std::string& path, const Bytes& data, bool if_absent) {
        Aws::S3::Model::PutObjectRequest request;
        request.SetBucket(bucket);
        request.SetKey(ObjectKey(path));
        if (if_absent) {
            request.SetIfNoneMatch("*");
        }

        auto stream = std::make_shared<Aws::StringStream>();
        stream->write(reinterpret_cast<const char*>(data.data()), data.size());
        request.SetBody(stream);

        auto outcome = s3->PutObject(request);
        if (!outcome.IsSuccess()) {
            auto code = outcome.GetError().GetResponseCode();
            if (if_absent && (code == Aws::Http::HttpResponseCode::PRECONDITION_FAILED ||
                              code == Aws::Http::HttpResponseCode::CONFLICT)) {
                throw NodeExistsError(path);
            }
            ThrowUnavailable("PutObject", path, outcome.GetError());
        }
    }
};

S3CoordinationStore::S3CoordinationStore(const Config& cfg) : p_impl(std::make_unique<S3StoreImpl>()) {
    AcquireSdk();

    Aws::Client::ClientConfiguration aws_cfg;
    if (!cfg.s3_region.empty()) {
        aws_cfg.region = cfg.s3_region;
    }
    if (!cfg.s3_endpoint.empty()) {
        aws_cfg.endpointOverride = cfg.s3_endpoint;
    }

    Aws::Auth::AWSCredentials creds;
    if (!cfg.aws_access_key_id.empty() && !cfg.aws_secret_access_key.empty()) {
        creds.SetAWSAccessKeyId(cfg.aws_access_key_id.c_str());
        creds.SetAWSSecretKey(cfg.aws_secret_access_key.c_str());
    }

    // The AWS C++ SDK uses 'useVirtualAddressing'. Path style is the inverse.
    bool useVirtualAddressing = !cfg.s3_use_path_style;

    p_impl->s3 = std::make_unique<Aws::S3::S3Client>(creds, aws_cfg,
        Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
        useVirtualAddressing);

    p_impl->bucket = cfg.s3_bucket;
}

S3CoordinationStore::~S3CoordinationStore() {
    p_impl->s3.reset();
    ReleaseSdk();
}

std::vector<std::string> S3CoordinationStore::ListChildren(const std::string& dir) {
    const std::string prefix = ChildPrefix(dir);
    std::vector<std::string> children;

    Aws::S3::Model::ListObjectsV2Request request;
    request.SetBucket(p_impl->bucket);
    request.SetPrefix(prefix);
    request.SetDelimiter("/");

    while (true) {
        auto outcome = p_impl->s3->ListObjectsV2(request);
        if (!outcome.IsSuccess()) {
            ThrowUnavailable("ListObjectsV2", dir, outcome.GetError());
        }
        const auto& result = outcome.GetResult();
        for (const auto& object : result.GetContents()) {
            std::string name(object.GetKey().c_str() + prefix.size());
            if (!name.empty()) {
                children.push_back(std::move(name));
            }
        }
        // Keys with further segments are nodes that have children of their own.
        for (const auto& common : result.GetCommonPrefixes()) {
            std::string name(common.GetPrefix().c_str() + prefix.size());
            if (!name.empty() && name.back() == '/') {
                name.pop_back();
            }
            if (!name.empty()) {
                children.push_back(std::move(name));
            }
        }
        if (!result.GetIsTruncated()) {
            break;
        }
        request.SetContinuationToken(result.GetNextContinuationToken());
    }
    return children;
}

std::optional<NodeStat> S3CoordinationStore::Exists(const std::string& path) {
    Aws::S3::Model::HeadObjectRequest request;
    request.SetBucket(p_impl->bucket);
    request.SetKey(ObjectKey(path));

    auto outcome = p_impl->s3->HeadObject(request);
    if (!outcome.IsSuccess()) {
        if (IsNotFound(outcome.GetError().GetResponseCode())) {
            return std::nullopt;
        }
        ThrowUnavailable("HeadObject", path, outcome.GetError());
    }

    // Last-Modified has one-second resolution, so the value is a whole second in ms.
    NodeStat stat;
    stat.mzxid = outcome.GetResult().GetLastModified().Millis();
    stat.czxid = stat.mzxid;
    return stat;
}

void S3CoordinationStore::Create(const std::string& path, const Bytes& data) {
    p_impl->Put(path, data, true);
}

void S3CoordinationStore::SetData(const std::string& path, const Bytes& data,
                                  std::int32_t version) {
    if (version != kAnyVersion && version != 0) {
        throw BadVersionError(path);
    }
    if (!Exists(path)) {
        throw NoNodeError(path);
    }
    p_impl->Put(path, data, false);
}

Bytes S3CoordinationStore::GetData(const std::string& path) {
    Aws::S3::Model::GetObjectRequest request;
    request.SetBucket(p_impl->bucket);
    request.SetKey(ObjectKey(path));

    auto outcome = p_impl->s3->GetObject(request);
    if (!outcome.IsSuccess()) {
        if (IsNotFound(outcome.GetError().GetResponseCode())) {
            throw NoNodeError(path);
        }
        ThrowUnavailable("GetObject", path, outcome.GetError());
    }

    auto& body = outcome.GetResult().GetBody();
    std::stringstream ss;
    ss << body.rdbuf();
    std::string s = ss.str();
    return Bytes(s.begin(), s.end());
}

void S3CoordinationStore::Delete(const std::string& path, std::int32_t version) {
    if (version != kAnyVersion && version != 0) {
        throw BadVersionError(path);
    }
    // S3 deletes succeed on missing keys; probe first to report NoNodeError.
    if (!Exists(path)) {
        throw NoNodeError(path);
    }

    Aws::S3::Model::DeleteObjectRequest request;
    request.SetBucket(p_impl->bucket);
    request.SetKey(ObjectKey(path));

    auto outcome = p_impl->s3->DeleteObject(request);
    if (!outcome.IsSuccess()) {
        if (IsNotFound(outcome.GetError().GetResponseCode())) {
            throw NoNodeError(path);
        }
        ThrowUnavailable("DeleteObject", path, outcome.GetError());
    }
}

void S3CoordinationStore::EnsurePath(const std::string& path) {
    // Prefixes need no marker object; only validate the path.
    ObjectKey(path);
}

} // namespace trackmap
