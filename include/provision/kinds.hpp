#pragma once

namespace clusterboot {
namespace kinds {

inline constexpr const char kNamespace[] = "Namespace";
inline constexpr const char kSecret[] = "Secret";
inline constexpr const char kConfigMap[] = "ConfigMap";
inline constexpr const char kService[] = "Service";
inline constexpr const char kDeployment[] = "Deployment";
inline constexpr const char kPersistentVolumeClaim[] = "PersistentVolumeClaim";
inline constexpr const char kStorageClass[] = "StorageClass";
inline constexpr const char kClusterIssuer[] = "ClusterIssuer";
inline constexpr const char kCertificate[] = "Certificate";
inline constexpr const char kGateway[] = "Gateway";
inline constexpr const char kHTTPRoute[] = "HTTPRoute";

inline constexpr const char kCoreV1[] = "v1";
inline constexpr const char kAppsV1[] = "apps/v1";
inline constexpr const char kStorageV1[] = "storage.k8s.io/v1";
inline constexpr const char kCertManagerV1[] = "cert-manager.io/v1";
inline constexpr const char kGatewayV1[] = "gateway.networking.k8s.io/v1";

} // namespace kinds
} // namespace clusterboot
