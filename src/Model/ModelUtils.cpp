//
// Created by moinshaikh on 2/4/26.
//

#include<tuple>

#include<torch/torch.h>


#include"../../include/Model/ModelUtils.hpp"
#include<doctest/doctest.h>


namespace RolloutEngine
{
    /**
     * @details QR-decomposes a Gaussian matrix of the flattened shape and
     * corrects the column signs with the diagonal of R, so the result is
     * uniformly distributed over orthogonal matrices.
     */
    torch::Tensor orthogonal_(torch::Tensor tensor, double gain)
    {
        torch::NoGradGuard guard;
        if (tensor.dim() < 2)
        {
            return tensor;
        }

        const auto rows = tensor.size(0);
        const auto columns = tensor.numel() / rows;
        auto flattened = torch::randn({rows, columns});
        if (rows < columns)
        {
            flattened.t_();
        }
        torch::Tensor q, r;
        std::tie(q, r) = torch::linalg_qr(flattened);
        q *= torch::diag(r, 0).sign();

        if (rows < columns)
        {
            q.t_();
        }

        tensor.view_as(q).copy_(q);
        tensor.mul_(gain);

        return tensor;
    }

    torch::Tensor FlattenImpl::forward(torch::Tensor x)
    {
        return x.view({x.size(0), -1});
    }

    void initWeights(torch::OrderedDict<std::string, torch::Tensor> parameters,
                     double weightGain,
                     double biasValue)
    {
        for (const auto &parameter : parameters)
        {
            if (parameter.value().size(0) == 0)
            {
                continue;
            }
            if (parameter.key().find("bias") != std::string::npos)
            {
                torch::nn::init::constant_(parameter.value(), biasValue);
            }
            else if (parameter.key().find("weight") != std::string::npos)
            {
                orthogonal_(parameter.value(), weightGain);
            }
        }
    }

    TEST_CASE("Flatten")
    {
        auto flatten = Flatten();

        SUBCASE("Windowed MLP states become one row per worker")
        {
            auto output = flatten->forward(torch::rand({3, 4, 6}));

            CHECK(output.size(0) == 3);
            CHECK(output.size(1) == 24);
        }

        SUBCASE("A window of one leaves flat rows untouched")
        {
            auto input = torch::rand({5, 1, 7});
            auto output = flatten->forward(input);

            CHECK(output.sizes().vec() == std::vector<int64_t>{5, 7});
            CHECK(torch::equal(output, input.squeeze(1)));
        }
    }

    TEST_CASE("initWeights()")
    {
        auto module = torch::nn::Sequential(
            torch::nn::Linear(5, 10),
            torch::nn::Functional(torch::tanh),
            torch::nn::Linear(10, 8));

        initWeights(module->named_parameters(), 1, 0);

        SUBCASE("Biases are set to the requested value")
        {
            for (const auto &parameter : module->named_parameters())
            {
                if (parameter.key().find("bias") != std::string::npos)
                {
                    CHECK(parameter.value().abs().max().item().toDouble() == doctest::Approx(0));
                }
            }
        }

        SUBCASE("Weights have orthonormal rows or columns")
        {
            auto weight = module->named_parameters()["2.weight"];
            // [8, 10]: rows are orthonormal
            auto gram = torch::matmul(weight, weight.t());
            CHECK(torch::allclose(gram, torch::eye(8), 1e-4, 1e-4));
        }
    }
}
