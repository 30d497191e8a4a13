//
// Created by moinshaikh on 1/28/26.
//

#ifndef ROLLOUTENGINE_CNNBASE_HPP
#define ROLLOUTENGINE_CNNBASE_HPP

#include<torch/torch.h>

#include"NNBase.hpp"

namespace RolloutEngine
{
    /**
     * @brief Convolutional actor-critic trunk for stacked 84x84 frames
     *
     * The window axis of the state doubles as the channel axis, so a state
     * [workers, window, 84, 84] goes straight into the first convolution.
     * Frames are expected to be scaled to [0, 1] by a feature processor
     * before they reach the experience store.
     *
     * Three convolutions (8x8/4, 4x4/2, 3x3/1) followed by a linear layer to
     * `hiddenSize` features; actor and critic share this trunk and the critic
     * only adds the linear value head.
     */
    class CnnBase : public NNBase
    {
    private:
        torch::nn::Sequential main;          /**< Shared convolutional trunk */
        torch::nn::Linear criticLinear;      /**< Value head on top of the trunk */

    public:
        /// Height and width of the frames the trunk is sized for
        static constexpr int64_t frameSize = 84;

        /**
         * @param numFrames Window length, used as the number of input channels
         * @param hiddenSize Width of the feature vector after the trunk
         * @param valueSize Width of the value head
         */
        CnnBase(unsigned int numFrames,
            unsigned int hiddenSize = 512,
            unsigned int valueSize = 1);

        std::vector<torch::Tensor> forward(torch::Tensor state) override;
    };
}
#endif //ROLLOUTENGINE_CNNBASE_HPP
