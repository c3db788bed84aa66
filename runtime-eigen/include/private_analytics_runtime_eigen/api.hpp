#ifndef PRIVATE_ANALYTICS_RUNTIME_EIGEN_API_HPP
#define PRIVATE_ANALYTICS_RUNTIME_EIGEN_API_HPP

extern "C" {

    // direct mechanism api; NaN on invalid arguments or when the secure source fails
    double laplace_mechanism(double value, double epsilon, double sensitivity);

    double gaussian_mechanism(double value, double epsilon, double delta, double sensitivity);
}


#endif //PRIVATE_ANALYTICS_RUNTIME_EIGEN_API_HPP
