#ifndef PRIVATE_ANALYTICS_RUNTIME_EIGEN_MECHANISMS_HPP
#define PRIVATE_ANALYTICS_RUNTIME_EIGEN_MECHANISMS_HPP

#include <map>
#include <string>

#include <Eigen/Dense>
#include <boost/optional.hpp>

#include <analytics.pb.h>
#include <private_analytics/config.hpp>
#include <private_analytics/types.hpp>

namespace private_analytics {

// noised occurrence count carried by every event; one contributor adds at most 1
extern const char* const kOccurrenceField;

double laplaceScale(double epsilon, double sensitivity);
double gaussianSigma(double epsilon, double delta, double sensitivity);

// components that obfuscate data
class Mechanism {
public:
    virtual ~Mechanism() = default;
    virtual std::string get_name() const = 0;
    virtual proto::NoiseMechanism get_kind() const = 0;
    virtual double scale(double epsilon, double sensitivity) const = 0;

    // adds noise calibrated per element; sizes of all three vectors must agree
    Eigen::VectorXd apply(const Eigen::VectorXd& values, const Eigen::VectorXd& epsilons,
                          const Eigen::VectorXd& sensitivities) const;
protected:
    virtual Eigen::VectorXd sample_unit(Eigen::Index size) const = 0;
};

// count-valued fields
class LaplaceMechanism : public Mechanism {
public:
    std::string get_name() const override;
    proto::NoiseMechanism get_kind() const override;
    double scale(double epsilon, double sensitivity) const override;
protected:
    Eigen::VectorXd sample_unit(Eigen::Index size) const override;
};

// continuous-valued fields
class GaussianMechanism : public Mechanism {
    double _delta;
public:
    static constexpr double kDefaultDelta = 1e-5;

    explicit GaussianMechanism(double delta = kDefaultDelta);
    std::string get_name() const override;
    proto::NoiseMechanism get_kind() const override;
    double scale(double epsilon, double sensitivity) const override;
    double get_delta() const { return this->_delta; }
protected:
    Eigen::VectorXd sample_unit(Eigen::Index size) const override;
};

std::string mechanismName(proto::NoiseMechanism mechanism);

class SensitivityTable {
    std::map<std::string, SensitivityBound> _bounds;
public:
    explicit SensitivityTable(const std::vector<SensitivityBound>& bounds);
    boost::optional<SensitivityBound> lookup(const std::string& field) const;
    std::size_t size() const { return this->_bounds.size(); }
};

// Noises every numeric field of an event plus its occurrence count. The allocated
// epsilon is split evenly across them; sensitivities come only from the reviewed table.
class NoiseGenerator {
    SensitivityTable _table;
    LaplaceMechanism _laplace;
    GaussianMechanism _gaussian;
public:
    explicit NoiseGenerator(const Config& config);

    // throws UndeclaredNumericField before any noise is drawn
    std::map<std::string, proto::NoisedField> noise(const FieldMap& fields, double epsilon) const;

    // first numeric field without a sensitivity bound, if any
    boost::optional<std::string> undeclared_field(const FieldMap& fields) const;

    const SensitivityTable& get_table() const { return this->_table; }
};

} // namespace private_analytics

#endif //PRIVATE_ANALYTICS_RUNTIME_EIGEN_MECHANISMS_HPP
