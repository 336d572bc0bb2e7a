// Copyright (C) 2026 The sitedeploy authors
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.

#include "sitedeploy/SiteDeployErrors.hh"

#include <string>

using namespace sitedeploy;

namespace
{
  class WebhookErrorCategory : public std::error_category
  {
  public:
    const char *name() const noexcept final
    {
      return "webhook";
    }

    std::string message(int ev) const final
    {
      switch (static_cast<WebhookErrc>(ev))
        {
        case WebhookErrc::Success:
          return "success";
        case WebhookErrc::MethodNotAllowed:
          return "method not allowed";
        case WebhookErrc::UnsupportedMediaType:
          return "unsupported media type";
        case WebhookErrc::InvalidSignature:
          return "invalid signature";
        case WebhookErrc::MalformedJson:
          return "malformed JSON";
        case WebhookErrc::UnknownRepository:
          return "unknown repository";
        case WebhookErrc::RepositoryNotAuthorized:
          return "signature does not match repository";
        case WebhookErrc::UnknownEnvironment:
          return "unknown environment";
        case WebhookErrc::InvalidTask:
          return "unsupported deployment task";
        case WebhookErrc::InvalidDeploymentId:
          return "invalid deployment id";
        case WebhookErrc::InvalidCommitSha:
          return "invalid commit SHA";
        case WebhookErrc::EnvironmentMismatch:
          return "deployment status environment mismatch";
        case WebhookErrc::InvalidPayload:
          return "invalid deployment payload";
        case WebhookErrc::InvalidArtifactUrl:
          return "invalid artifact URL";
        case WebhookErrc::InvalidChecksum:
          return "invalid artifact checksum";
        }
      return "unknown webhook error";
    }
  };

  class DeployErrorCategory : public std::error_category
  {
  public:
    const char *name() const noexcept final
    {
      return "deploy";
    }

    std::string message(int ev) const final
    {
      switch (static_cast<DeployErrc>(ev))
        {
        case DeployErrc::Success:
          return "success";
        case DeployErrc::CredentialsUnavailable:
          return "failed to obtain installation credentials";
        case DeployErrc::LockTimeout:
          return "timeout waiting for deployment lock";
        case DeployErrc::LockCancelled:
          return "wait for deployment lock cancelled";
        case DeployErrc::LockFailed:
          return "failed to acquire deployment lock";
        case DeployErrc::ArtifactTooLarge:
          return "artifact too large";
        case DeployErrc::DownloadFailed:
          return "failed to download artifact";
        case DeployErrc::IntegrityCheckFailed:
          return "artifact checksum mismatch";
        case DeployErrc::InvalidArchive:
          return "invalid artifact archive";
        case DeployErrc::ExtractionFailed:
          return "failed to extract artifact";
        case DeployErrc::WebrootNotSymlink:
          return "webroot is not a symbolic link";
        case DeployErrc::SwapFailed:
          return "failed to publish new version";
        case DeployErrc::InternalError:
          return "internal error";
        }
      return "unknown deploy error";
    }
  };

  class ConfigErrorCategory : public std::error_category
  {
  public:
    const char *name() const noexcept final
    {
      return "config";
    }

    std::string message(int ev) const final
    {
      switch (static_cast<ConfigErrc>(ev))
        {
        case ConfigErrc::Success:
          return "success";
        case ConfigErrc::FileNotFound:
          return "configuration file not found";
        case ConfigErrc::MalformedJson:
          return "malformed configuration";
        case ConfigErrc::MissingField:
          return "missing configuration field";
        case ConfigErrc::InvalidField:
          return "invalid configuration field";
        }
      return "unknown configuration error";
    }
  };

  const WebhookErrorCategory globalWebhookErrorCategory{};
  const DeployErrorCategory globalDeployErrorCategory{};
  const ConfigErrorCategory globalConfigErrorCategory{};
} // namespace

std::error_code
sitedeploy::make_error_code(WebhookErrc ec)
{
  return std::error_code{static_cast<int>(ec), globalWebhookErrorCategory};
}

std::error_code
sitedeploy::make_error_code(DeployErrc ec)
{
  return std::error_code{static_cast<int>(ec), globalDeployErrorCategory};
}

std::error_code
sitedeploy::make_error_code(ConfigErrc ec)
{
  return std::error_code{static_cast<int>(ec), globalConfigErrorCategory};
}

int
sitedeploy::http_status(std::error_code ec)
{
  if (ec.category() != globalWebhookErrorCategory)
    {
      return 500;
    }

  switch (static_cast<WebhookErrc>(ec.value()))
    {
    case WebhookErrc::Success:
      return 200;
    case WebhookErrc::MethodNotAllowed:
      return 405;
    case WebhookErrc::UnsupportedMediaType:
      return 415;
    case WebhookErrc::InvalidSignature:
    case WebhookErrc::RepositoryNotAuthorized:
      return 403;
    case WebhookErrc::MalformedJson:
    case WebhookErrc::UnknownRepository:
    case WebhookErrc::UnknownEnvironment:
    case WebhookErrc::InvalidTask:
    case WebhookErrc::InvalidDeploymentId:
    case WebhookErrc::InvalidCommitSha:
    case WebhookErrc::EnvironmentMismatch:
    case WebhookErrc::InvalidPayload:
    case WebhookErrc::InvalidArtifactUrl:
    case WebhookErrc::InvalidChecksum:
      return 400;
    }
  return 500;
}
