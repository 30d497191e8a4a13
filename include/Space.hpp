#pragma once
//
// Created by moinshaikh on 1/27/26.
//

#ifndef ROLLOUTENGINE_SPACE_HPP
#define ROLLOUTENGINE_SPACE_HPP

#include<string>
#include<vector>
#include<torch/torch.h>

namespace RolloutEngine
{
    /**
     * @brief Description of the action space a policy acts in
     *
     * `type` is one of "Discrete", "Box" or "MultiBinary". For "Discrete" the
     * first entry of `shape` is the number of actions, otherwise it is the
     * number of action dimensions.
     */
    struct ActionSpace
    {
        std::string type;
        std::vector<int64_t> shape;

        inline bool isDiscrete() const
        {
            return type == "Discrete";
        }

        /** @return Number of values one worker's action occupies in storage */
        inline int64_t actionSize() const
        {
            return isDiscrete() ? 1 : shape[0];
        }
    };
}



#endif //ROLLOUTENGINE_SPACE_HPP
