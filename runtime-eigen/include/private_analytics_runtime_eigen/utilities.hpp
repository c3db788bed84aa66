
#ifndef PRIVATE_ANALYTICS_RUNTIME_EIGEN_UTILITIES_HPP
#define PRIVATE_ANALYTICS_RUNTIME_EIGEN_UTILITIES_HPP

#include <Eigen/Dense>

namespace private_analytics {

// All samplers draw from OpenSSL's CSPRNG and throw EntropyFailure rather than
// fall back to a predictable generator.

// uniform on the open interval (0, 1), 53 bits of precision
double sampleUniform();
double sampleUniform(double low, double high);

// inverse-transform sampling
double sampleLaplace(double mu = 0, double scale = 1);
Eigen::VectorXd sampleLaplace(Eigen::Index size, double scale);

// Box-Muller transform
double sampleGaussian(double mu = 0, double sigma = 1);
Eigen::VectorXd sampleGaussian(Eigen::Index size, double sigma);

} // namespace private_analytics

#endif //PRIVATE_ANALYTICS_RUNTIME_EIGEN_UTILITIES_HPP
