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

#ifndef SITEDEPLOY_ERRORS_HH
#define SITEDEPLOY_ERRORS_HH

#include <system_error>

namespace sitedeploy
{
  // Request errors. Reported synchronously to the webhook caller.
  enum class WebhookErrc
  {
    Success = 0,
    MethodNotAllowed = 1,
    UnsupportedMediaType,
    InvalidSignature,
    MalformedJson,
    UnknownRepository,
    RepositoryNotAuthorized,
    UnknownEnvironment,
    InvalidTask,
    InvalidDeploymentId,
    InvalidCommitSha,
    EnvironmentMismatch,
    InvalidPayload,
    InvalidArtifactUrl,
    InvalidChecksum,
  };

  // Operational errors. Reported out-of-band once a deployment was accepted.
  enum class DeployErrc
  {
    Success = 0,
    CredentialsUnavailable = 1,
    LockTimeout,
    LockCancelled,
    LockFailed,
    ArtifactTooLarge,
    DownloadFailed,
    IntegrityCheckFailed,
    InvalidArchive,
    ExtractionFailed,
    WebrootNotSymlink,
    SwapFailed,
    InternalError,
  };

  enum class ConfigErrc
  {
    Success = 0,
    FileNotFound = 1,
    MalformedJson,
    MissingField,
    InvalidField,
  };

  std::error_code make_error_code(WebhookErrc ec);
  std::error_code make_error_code(DeployErrc ec);
  std::error_code make_error_code(ConfigErrc ec);

  // HTTP status for a webhook response that failed with `ec`.
  int http_status(std::error_code ec);
} // namespace sitedeploy

namespace std
{
  template<>
  struct is_error_code_enum<sitedeploy::WebhookErrc> : true_type
  {
  };

  template<>
  struct is_error_code_enum<sitedeploy::DeployErrc> : true_type
  {
  };

  template<>
  struct is_error_code_enum<sitedeploy::ConfigErrc> : true_type
  {
  };
} // namespace std

#endif // SITEDEPLOY_ERRORS_HH
