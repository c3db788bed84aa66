#include "../include/private_analytics_runtime_eigen/mechanisms.hpp"
#include "../include/private_analytics_runtime_eigen/utilities.hpp"

#include <private_analytics/errors.hpp>

#include <cmath>
#include <stdexcept>
#include <vector>

namespace private_analytics {

const char* const kOccurrenceField = "occurrence_count";

constexpr double GaussianMechanism::kDefaultDelta;

double laplaceScale(double epsilon, double sensitivity) {
    if (!(epsilon > 0.) || !(sensitivity > 0.))
        throw std::invalid_argument("epsilon and sensitivity must be positive");
    return sensitivity / epsilon;
}

double gaussianSigma(double epsilon, double delta, double sensitivity) {
    if (!(epsilon > 0.) || !(sensitivity > 0.) || !(delta > 0.) || !(delta < 1.))
        throw std::invalid_argument("epsilon and sensitivity must be positive, delta in (0, 1)");
    return sensitivity * std::sqrt(2. * std::log(1.25 / delta)) / epsilon;
}

Eigen::VectorXd Mechanism::apply(const Eigen::VectorXd& values, const Eigen::VectorXd& epsilons,
                                 const Eigen::VectorXd& sensitivities) const {
    if (values.size() != epsilons.size() || values.size() != sensitivities.size())
        throw std::invalid_argument("values, epsilons and sensitivities differ in size");

    Eigen::VectorXd scales(values.size());
    for (Eigen::Index i = 0; i < values.size(); ++i)
        scales(i) = scale(epsilons(i), sensitivities(i));

    return values + sample_unit(values.size()).cwiseProduct(scales);
}

std::string LaplaceMechanism::get_name() const {
    return "laplace";
}

proto::NoiseMechanism LaplaceMechanism::get_kind() const {
    return proto::LAPLACE;
}

double LaplaceMechanism::scale(double epsilon, double sensitivity) const {
    return laplaceScale(epsilon, sensitivity);
}

Eigen::VectorXd LaplaceMechanism::sample_unit(Eigen::Index size) const {
    return sampleLaplace(size, 1.);
}

GaussianMechanism::GaussianMechanism(double delta) : _delta(delta) {}

std::string GaussianMechanism::get_name() const {
    return "gaussian";
}

proto::NoiseMechanism GaussianMechanism::get_kind() const {
    return proto::GAUSSIAN;
}

double GaussianMechanism::scale(double epsilon, double sensitivity) const {
    return gaussianSigma(epsilon, this->_delta, sensitivity);
}

Eigen::VectorXd GaussianMechanism::sample_unit(Eigen::Index size) const {
    return sampleGaussian(size, 1.);
}

std::string mechanismName(proto::NoiseMechanism mechanism) {
    switch (mechanism) {
        case proto::LAPLACE: return "laplace";
        case proto::GAUSSIAN: return "gaussian";
        default: return "unspecified";
    }
}

SensitivityTable::SensitivityTable(const std::vector<SensitivityBound>& bounds) {
    for (const auto& bound : bounds)
        this->_bounds.emplace(bound.field, bound);
}

boost::optional<SensitivityBound> SensitivityTable::lookup(const std::string& field) const {
    auto found = this->_bounds.find(field);
    if (found == this->_bounds.end()) return boost::none;
    return found->second;
}

NoiseGenerator::NoiseGenerator(const Config& config) : _table(config.sensitivity_table()) {}

boost::optional<std::string> NoiseGenerator::undeclared_field(const FieldMap& fields) const {
    for (const auto& field : fields) {
        if (field.first == kOccurrenceField) continue;
        if (isNumeric(field.second) && !this->_table.lookup(field.first)) return field.first;
    }
    return boost::none;
}

std::map<std::string, proto::NoisedField> NoiseGenerator::noise(const FieldMap& fields, double epsilon) const {
    if (!(epsilon > 0.))
        throw std::invalid_argument("noise requires a positive allocated epsilon");

    boost::optional<std::string> undeclared = undeclared_field(fields);
    if (undeclared)
        throw UndeclaredNumericField("no reviewed sensitivity for field " + *undeclared);

    std::vector<std::string> countNames{kOccurrenceField}, continuousNames;
    std::vector<double> countValues{1.}, countBounds{1.}, continuousValues, continuousBounds;
    for (const auto& field : fields) {
        if (!isNumeric(field.second) || field.first == kOccurrenceField) continue;
        SensitivityBound bound = *this->_table.lookup(field.first);
        double value = boost::get<double>(field.second);
        if (bound.kind == FieldKind::Count) {
            countNames.push_back(field.first);
            countValues.push_back(value);
            countBounds.push_back(bound.bound);
        } else {
            continuousNames.push_back(field.first);
            continuousValues.push_back(value);
            continuousBounds.push_back(bound.bound);
        }
    }

    std::map<std::string, proto::NoisedField> noised;
    std::size_t numericCount = countNames.size() + continuousNames.size();

    // sequential composition across the fields of one event
    double fieldEpsilon = epsilon / static_cast<double>(numericCount);

    auto release = [&](const Mechanism& mechanism, const std::vector<std::string>& names,
                       const std::vector<double>& values, const std::vector<double>& bounds, bool integral) {
        if (names.empty()) return;
        auto size = static_cast<Eigen::Index>(names.size());
        Eigen::Map<const Eigen::VectorXd> rawValues(values.data(), size);
        Eigen::Map<const Eigen::VectorXd> sensitivities(bounds.data(), size);

        // clip into the declared bound so the sensitivity holds
        Eigen::VectorXd clipped = rawValues.cwiseMax(0.).cwiseMin(sensitivities);
        Eigen::VectorXd result = mechanism.apply(clipped, Eigen::VectorXd::Constant(size, fieldEpsilon), sensitivities);

        // post-processing: rounding and non-negativity
        if (integral)
            result = result.array().round().max(0.).matrix();
        else
            result = ((result.array() * 100.).round() / 100.).max(0.).matrix();

        for (Eigen::Index i = 0; i < size; ++i) {
            proto::NoisedField field;
            field.set_value(result(i));
            field.set_mechanism(mechanism.get_kind());
            noised[names[static_cast<std::size_t>(i)]] = field;
        }
    };

    release(this->_laplace, countNames, countValues, countBounds, true);
    release(this->_gaussian, continuousNames, continuousValues, continuousBounds, false);
    return noised;
}

} // namespace private_analytics
